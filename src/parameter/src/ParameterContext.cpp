#include "ParameterContext.hpp"
#include "TableAndSchemaNameMapper.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef PIPECHECK_VERSION
#define PIPECHECK_VERSION "unknown"
#endif
#ifndef PIPECHECK_BUILD_TARGET
#define PIPECHECK_BUILD_TARGET "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--verbose", 'v', "Enable debug logging", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: pipecheck [OPTIONS]...\n\n"
              << "Checks that the source and target data sources of a pipeline job are ready.\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  PIPECHECK_SOURCE_PASSWORD   Overrides source.password\n"
              << "  PIPECHECK_TARGET_PASSWORD   Overrides target.password\n"
              << "\nExit status:\n"
              << "  0 all checks passed, 1 usage or configuration error, 2 invalid connection,\n"
              << "  3 target table not empty, 4 privilege or variable check failed\n"
              << "\nExamples:\n"
              << "  pipecheck --config-file=job.yaml\n"
              << "  pipecheck -v -c job.yaml\n\n";
}

void ParameterContext::show_version() {
    std::cout << "pipecheck version: " << PIPECHECK_VERSION << std::endl;
    std::cout << "build: " << PIPECHECK_BUILD_TARGET << std::endl;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config.IsMap()) {
        throw std::runtime_error("Configuration root must be a map.");
    }

    static const std::set<std::string> valid_keys = {"log", "source", "target", "importer"};
    YAML::check_unknown_keys(config, valid_keys, "root");

    if (config["log"]) {
        config_.log = config["log"].as<LogConfig>();
    }
    if (config["source"]) {
        config_.source = YAML::decode_data_source(config["source"], "source");
    }
    if (config["target"]) {
        config_.target = YAML::decode_data_source(config["target"], "target");
    }
    if (config["importer"]) {
        config_.importer = config["importer"].as<ImporterConfig>();
        has_importer_ = true;
    }

    validate();
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (!cli_params.count("--config-file")) {
        throw std::runtime_error("Missing required parameter: --config-file or -c");
    }
    merge_yaml(cli_params["--config-file"]);
}

void ParameterContext::validate() const {
    if (!config_.source.enabled && !config_.target.enabled) {
        throw std::runtime_error("At least one of 'source' and 'target' must be configured.");
    }
    if (config_.target.enabled && !has_importer_) {
        throw std::runtime_error("Missing required section 'importer' for target.");
    }
    if (has_importer_) {
        // Rejects malformed or conflicting table names before any data source is contacted
        TableAndSchemaNameMapper::validate(config_.importer.tables);
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (!arg.empty() && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--verbose")) {
        config_.verbose = true;
        config_.log.level = LogUtils::Level::Debug;
    }
}

void ParameterContext::merge_environment_vars() {
    if (const char* password = std::getenv("PIPECHECK_SOURCE_PASSWORD")) {
        config_.source.password = password;
    }
    if (const char* password = std::getenv("PIPECHECK_TARGET_PASSWORD")) {
        config_.target.password = password;
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    return true;
}

const CheckJobConfig& ParameterContext::get_config() const {
    return config_;
}

const DataSourceConfig& ParameterContext::get_source() const {
    return config_.source;
}

const DataSourceConfig& ParameterContext::get_target() const {
    return config_.target;
}
