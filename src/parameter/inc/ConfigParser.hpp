#pragma once

#include "CheckJobConfig.hpp"
#include "DatabaseType.hpp"
#include "LogUtils.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    inline void check_map(const YAML::Node& node, const std::string& context) {
        if (!node.IsMap()) {
            throw std::runtime_error("Configuration section '" + context + "' must be a map.");
        }
    }

    template<>
    struct convert<LogConfig> {
        static bool decode(const Node& node, LogConfig& rhs) {
            check_map(node, "log");
            static const std::set<std::string> valid_keys = {"level", "file"};
            check_unknown_keys(node, valid_keys, "log");

            if (node["level"]) {
                const std::string level = node["level"].as<std::string>();
                try {
                    rhs.level = LogUtils::parse_level(level);
                } catch (const std::invalid_argument&) {
                    throw std::runtime_error("Invalid log level: " + level + " in log.");
                }
            }
            if (node["file"]) {
                rhs.file = node["file"].as<std::string>();
                if (rhs.file.empty()) {
                    throw std::runtime_error("Log file path must not be empty.");
                }
            }
            return true;
        }
    };

    // Shared by the source and target sections
    inline DataSourceConfig decode_data_source(const Node& node, const std::string& context) {
        check_map(node, context);
        static const std::set<std::string> valid_keys = {"type", "url", "user", "password"};
        check_unknown_keys(node, valid_keys, context);

        DataSourceConfig rhs;
        if (node["type"]) {
            const std::string type = node["type"].as<std::string>();
            try {
                rhs.type = string_to_database_type(type);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(std::string(e.what()) + " in " + context + ".");
            }
        } else {
            throw std::runtime_error("Missing required field 'type' in " + context + ".");
        }

        if (node["url"]) {
            rhs.url = node["url"].as<std::string>();
        }
        if (rhs.url.empty()) {
            throw std::runtime_error("Missing required field 'url' in " + context + ".");
        }
        if (node["user"]) {
            rhs.user = node["user"].as<std::string>();
        }
        if (node["password"]) {
            rhs.password = node["password"].as<std::string>();
        }

        rhs.enabled = true;
        return rhs;
    }

    template<>
    struct convert<ImporterConfig> {
        static bool decode(const Node& node, ImporterConfig& rhs) {
            check_map(node, "importer");
            static const std::set<std::string> valid_keys = {"tables"};
            check_unknown_keys(node, valid_keys, "importer");

            if (!node["tables"]) {
                throw std::runtime_error("Missing required field 'tables' in importer.");
            }
            if (!node["tables"].IsSequence()) {
                throw std::runtime_error("Field 'tables' in importer must be a sequence.");
            }
            rhs.tables = node["tables"].as<std::vector<std::string>>();
            if (rhs.tables.empty()) {
                throw std::runtime_error("Importer must have at least one table defined.");
            }
            return true;
        }
    };

} // namespace YAML
