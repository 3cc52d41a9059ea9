#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "DataSourceFactory.hpp"
#include "DataSourceCheckEngine.hpp"
#include "ImporterConfiguration.hpp"
#include "PipelineJobExceptions.hpp"
#include <iostream>

namespace {

enum ExitCode {
    EXIT_PASSED = 0,
    EXIT_CONFIG_ERROR = 1,
    EXIT_INVALID_CONNECTION = 2,
    EXIT_TABLE_NOT_EMPTY = 3,
    EXIT_DIALECT_CHECK_FAILED = 4
};

void check_source(const DataSourceConfig& config) {
    LogUtils::info("Checking source {}", config.get_data_source_info());
    auto data_source = DataSourceFactory::create(config);
    DataSourceCheckEngine engine(config.type);
    if (!engine.has_dialect_checker()) {
        LogUtils::info("No privilege or variable rules for {}, checking connection only",
                       database_type_to_string(config.type));
    }
    engine.check_source_data_source(*data_source);
    LogUtils::info("Source {} is ready", data_source->get_data_source_info());
}

void check_target(const DataSourceConfig& config, const ImporterConfig& importer) {
    LogUtils::info("Checking target {}", config.get_data_source_info());
    auto data_source = DataSourceFactory::create(config);
    ImporterConfiguration importer_config(importer.tables);
    for (const auto& table : importer_config.get_qualified_tables()) {
        LogUtils::debug("Target table: {}", table.to_string());
    }
    DataSourceCheckEngine engine(config.type);
    engine.check_target_data_source(*data_source, importer_config);
    LogUtils::info("Target {} is ready, {} table(s) empty",
                   data_source->get_data_source_info(), importer_config.get_logic_table_names().size());
}

int run_checks(const CheckJobConfig& config) {
    try {
        if (config.source.enabled) {
            check_source(config.source);
        }
        if (config.target.enabled) {
            check_target(config.target, config.importer);
        }
    } catch (const PrepareJobWithInvalidConnectionException& e) {
        LogUtils::error("{}", e.what());
        return EXIT_INVALID_CONNECTION;
    } catch (const PrepareJobWithTargetTableNotEmptyException& e) {
        LogUtils::error("{}", e.what());
        return EXIT_TABLE_NOT_EMPTY;
    } catch (const DialectCheckException& e) {
        LogUtils::error("{}", e.what());
        return EXIT_DIALECT_CHECK_FAILED;
    } catch (const std::exception& e) {
        LogUtils::error("Error during checks: {}", e.what());
        return EXIT_CONFIG_ERROR;
    }

    LogUtils::info("All pre-flight checks passed!");
    return EXIT_PASSED;
}

}

int main(int argc, char* argv[]) {
    ParameterContext context;

    try {
        if (!context.init(argc, argv)) {
            return EXIT_PASSED;
        }
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        return EXIT_CONFIG_ERROR;
    }

    const CheckJobConfig& config = context.get_config();
    try {
        LogUtils::init(config.log.level, config.log.file);
    } catch (const std::exception& e) {
        LogUtils::error("Failed to initialize logging to '{}': {}", config.log.file, e.what());
        return EXIT_CONFIG_ERROR;
    }

    const int result = run_checks(config);
    LogUtils::shutdown();
    return result;
}
