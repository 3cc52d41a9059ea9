#pragma once

#include "DataSourceConfig.hpp"
#include "LogUtils.hpp"
#include <string>
#include <vector>

struct LogConfig {
    LogUtils::Level level = LogUtils::Level::Info;
    std::string file = "log/pipecheck.log";
};

struct ImporterConfig {
    // "schema.table" or "table"
    std::vector<std::string> tables;
};

struct CheckJobConfig {
    bool verbose = false;
    LogConfig log;
    DataSourceConfig source;
    DataSourceConfig target;
    ImporterConfig importer;
};
