#include "ImporterConfiguration.hpp"
#include "StringUtils.hpp"
#include <set>

namespace {

std::vector<std::string> distinct_ignore_case(const std::vector<std::string>& names) {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& each : names) {
        if (seen.insert(StringUtils::to_lower(each)).second) {
            result.push_back(each);
        }
    }
    return result;
}

}

ImporterConfiguration::ImporterConfiguration(const std::vector<std::string>& qualified_table_names)
    : mapper_(qualified_table_names) {
    std::vector<std::string> table_names;
    table_names.reserve(qualified_table_names.size());
    for (const auto& each : qualified_table_names) {
        table_names.push_back(TableAndSchemaNameMapper::split_qualified_name(each).second);
    }
    logic_table_names_ = distinct_ignore_case(table_names);
}

ImporterConfiguration::ImporterConfiguration(std::vector<std::string> logic_table_names,
                                             TableAndSchemaNameMapper mapper)
    : logic_table_names_(distinct_ignore_case(logic_table_names)), mapper_(std::move(mapper)) {}

std::vector<QualifiedTable> ImporterConfiguration::get_qualified_tables() const {
    std::vector<QualifiedTable> result;
    result.reserve(logic_table_names_.size());
    for (const auto& each : logic_table_names_) {
        result.push_back({mapper_.get_schema_name(each), each});
    }
    return result;
}
