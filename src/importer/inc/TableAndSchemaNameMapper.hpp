#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Resolves the schema a logical table lives in. Table names match case-insensitively.
class TableAndSchemaNameMapper {
public:
    TableAndSchemaNameMapper() = default;

    // table name -> schema name
    explicit TableAndSchemaNameMapper(const std::map<std::string, std::string>& table_schema_map);

    // Entries of the form "schema.table" or "table". Throws std::invalid_argument
    // when one table name is listed under two different schemas.
    explicit TableAndSchemaNameMapper(const std::vector<std::string>& qualified_table_names);

    // Empty when the table has no schema mapping
    std::string get_schema_name(const std::string& logic_table_name) const;

    size_t size() const { return mapping_.size(); }

    // Same checks as the qualified-name constructor, without building a mapper
    static void validate(const std::vector<std::string>& qualified_table_names);

    // "schema.table" -> {schema, table}; "table" -> {"", table}
    static std::pair<std::string, std::string> split_qualified_name(const std::string& qualified_name);

private:
    void put(const std::string& table_name, const std::string& schema_name);

    std::unordered_map<std::string, std::string> mapping_;
};
