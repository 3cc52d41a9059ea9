#pragma once

#include "DataSource.hpp"
#include "DialectDataSourceChecker.hpp"
#include "ImporterConfiguration.hpp"
#include "PipelineCommonSQLBuilder.hpp"
#include "TableAndSchemaNameMapper.hpp"
#include <memory>
#include <string>
#include <vector>

// Pre-flight checks run before a pipeline job starts moving data.
//
// Every check is fail-fast: data sources and tables are visited in the order
// given, and the first violated precondition is thrown; nothing after it is
// contacted. Each probe opens its own connection and releases every handle
// before returning or throwing. Nothing is written to any data source.
class DataSourceCheckEngine {
public:
    explicit DataSourceCheckEngine(DatabaseType database_type);

    DataSourceCheckEngine(const DataSourceCheckEngine&) = delete;
    DataSourceCheckEngine& operator=(const DataSourceCheckEngine&) = delete;

    // Connection, then privileges, then variables
    void check_source_data_source(DataSource& data_source) const;

    // Connection, then emptiness of every table the importer writes to
    void check_target_data_source(DataSource& data_source, const ImporterConfiguration& importer_config) const;

    // Throws PrepareJobWithInvalidConnectionException
    void check_connection(const DataSourceRefs& data_sources) const;

    // Throws PrepareJobWithTargetTableNotEmptyException for the first table holding a row,
    // PrepareJobWithInvalidConnectionException when a probe cannot run
    void check_target_table(const DataSourceRefs& data_sources,
                            const TableAndSchemaNameMapper& table_and_schema_name_mapper,
                            const std::vector<std::string>& logic_table_names) const;

    // No-ops for dialects without a registered checker. Dialect exceptions propagate unchanged.
    void check_privilege(const DataSourceRefs& data_sources) const;
    void check_variable(const DataSourceRefs& data_sources) const;

    bool has_dialect_checker() const { return checker_ != nullptr; }

private:
    bool check_empty(DataSource& data_source, const std::string& sql) const;

    template <typename Check>
    void for_each_with_checker(const DataSourceRefs& data_sources, Check check) const;

    // Null when the dialect has no checker; only for_each_with_checker reads it
    std::unique_ptr<const DialectDataSourceChecker> checker_;
    PipelineCommonSQLBuilder sql_builder_;
};
