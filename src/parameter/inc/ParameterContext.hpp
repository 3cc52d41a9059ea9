#pragma once

#include "ConfigParser.hpp"
#include "CheckJobConfig.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when only help or version was requested
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    // At least one of source and target; target requires importer
    void validate() const;

    const CheckJobConfig& get_config() const;
    const DataSourceConfig& get_source() const;
    const DataSourceConfig& get_target() const;

private:
    CheckJobConfig config_;
    bool has_importer_ = false;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;

    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--config-file")
        char short_opt;          // Short option (e.g. 'c')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
