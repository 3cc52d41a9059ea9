#include "TableAndSchemaNameMapper.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

TableAndSchemaNameMapper::TableAndSchemaNameMapper(const std::map<std::string, std::string>& table_schema_map) {
    for (const auto& [table_name, schema_name] : table_schema_map) {
        put(table_name, schema_name);
    }
}

TableAndSchemaNameMapper::TableAndSchemaNameMapper(const std::vector<std::string>& qualified_table_names) {
    validate(qualified_table_names);
    for (const auto& each : qualified_table_names) {
        const auto [schema_name, table_name] = split_qualified_name(each);
        put(table_name, schema_name);
    }
}

std::pair<std::string, std::string> TableAndSchemaNameMapper::split_qualified_name(const std::string& qualified_name) {
    const auto parts = StringUtils::split(qualified_name, '.');
    if (parts.size() == 1) {
        return {"", parts[0]};
    }
    if (parts.size() == 2) {
        return {parts[0], parts[1]};
    }
    throw std::invalid_argument("Invalid qualified table name: " + qualified_name);
}

void TableAndSchemaNameMapper::validate(const std::vector<std::string>& qualified_table_names) {
    std::unordered_map<std::string, std::string> schemas;
    for (const auto& each : qualified_table_names) {
        const auto [schema_name, table_name] = split_qualified_name(each);
        if (table_name.empty()) {
            throw std::invalid_argument("Table name must not be empty in schema mapping");
        }
        const auto [it, inserted] = schemas.emplace(StringUtils::to_lower(table_name), schema_name);
        if (!inserted && !StringUtils::equals_ignore_case(it->second, schema_name)) {
            throw std::invalid_argument("Table '" + table_name + "' is mapped to more than one schema: '" +
                                        it->second + "' and '" + schema_name + "'");
        }
    }
}

void TableAndSchemaNameMapper::put(const std::string& table_name, const std::string& schema_name) {
    if (table_name.empty()) {
        throw std::invalid_argument("Table name must not be empty in schema mapping");
    }
    const auto [it, inserted] = mapping_.emplace(StringUtils::to_lower(table_name), schema_name);
    if (!inserted && !StringUtils::equals_ignore_case(it->second, schema_name)) {
        throw std::invalid_argument("Table '" + table_name + "' is mapped to more than one schema: '" +
                                    it->second + "' and '" + schema_name + "'");
    }
}

std::string TableAndSchemaNameMapper::get_schema_name(const std::string& logic_table_name) const {
    auto it = mapping_.find(StringUtils::to_lower(logic_table_name));
    return it == mapping_.end() ? std::string() : it->second;
}
