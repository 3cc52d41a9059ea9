#include "DataSourceCheckEngine.hpp"
#include "DialectDataSourceCheckerFactory.hpp"
#include "PipelineJobExceptions.hpp"
#include "LogUtils.hpp"
#include <exception>

DataSourceCheckEngine::DataSourceCheckEngine(DatabaseType database_type)
    : checker_(DialectDataSourceCheckerFactory::find_checker(database_type)),
      sql_builder_(database_type) {}

void DataSourceCheckEngine::check_source_data_source(DataSource& data_source) const {
    DataSourceRefs data_sources{data_source};
    check_connection(data_sources);
    check_privilege(data_sources);
    check_variable(data_sources);
}

void DataSourceCheckEngine::check_target_data_source(DataSource& data_source,
                                                     const ImporterConfiguration& importer_config) const {
    DataSourceRefs data_sources{data_source};
    check_connection(data_sources);
    check_target_table(data_sources, importer_config.get_table_and_schema_name_mapper(),
                       importer_config.get_logic_table_names());
}

void DataSourceCheckEngine::check_connection(const DataSourceRefs& data_sources) const {
    for (DataSource& each : data_sources) {
        LogUtils::debug("Checking connection of {}", each.get_data_source_info());
        try {
            auto connection = each.get_connection();
            connection->close();
        } catch (const std::exception&) {
            throw PrepareJobWithInvalidConnectionException(std::current_exception());
        }
    }
}

void DataSourceCheckEngine::check_target_table(const DataSourceRefs& data_sources,
                                               const TableAndSchemaNameMapper& table_and_schema_name_mapper,
                                               const std::vector<std::string>& logic_table_names) const {
    for (DataSource& each : data_sources) {
        for (const auto& table_name : logic_table_names) {
            const std::string sql = sql_builder_.build_check_empty_sql(
                table_and_schema_name_mapper.get_schema_name(table_name), table_name);
            LogUtils::debug("Checking target table {} on {}: {}", table_name, each.get_data_source_info(), sql);

            bool empty = false;
            try {
                empty = check_empty(each, sql);
            } catch (const std::exception&) {
                throw PrepareJobWithInvalidConnectionException(std::current_exception());
            }
            if (!empty) {
                throw PrepareJobWithTargetTableNotEmptyException(table_name);
            }
        }
    }
}

bool DataSourceCheckEngine::check_empty(DataSource& data_source, const std::string& sql) const {
    auto connection = data_source.get_connection();
    auto statement = connection->prepare_statement(sql);
    auto result_set = statement->execute_query();
    return !result_set->next();
}

template <typename Check>
void DataSourceCheckEngine::for_each_with_checker(const DataSourceRefs& data_sources, Check check) const {
    if (!checker_) {
        return;
    }
    for (DataSource& each : data_sources) {
        check(*checker_, each);
    }
}

void DataSourceCheckEngine::check_privilege(const DataSourceRefs& data_sources) const {
    for_each_with_checker(data_sources, [](const DialectDataSourceChecker& checker, DataSource& each) {
        LogUtils::debug("Checking privileges of {}", each.get_data_source_info());
        checker.check_privilege(each);
    });
}

void DataSourceCheckEngine::check_variable(const DataSourceRefs& data_sources) const {
    for_each_with_checker(data_sources, [](const DialectDataSourceChecker& checker, DataSource& each) {
        LogUtils::debug("Checking variables of {}", each.get_data_source_info());
        checker.check_variable(each);
    });
}
