#pragma once

#include "TableAndSchemaNameMapper.hpp"
#include <string>
#include <vector>

struct QualifiedTable {
    std::string schema_name;
    std::string table_name;

    std::string to_string() const {
        return schema_name.empty() ? table_name : schema_name + "." + table_name;
    }
};

class ImporterConfiguration {
public:
    ImporterConfiguration() = default;

    // Entries of the form "schema.table" or "table". Order is kept, duplicates
    // (case-insensitive) are dropped.
    explicit ImporterConfiguration(const std::vector<std::string>& qualified_table_names);

    ImporterConfiguration(std::vector<std::string> logic_table_names, TableAndSchemaNameMapper mapper);

    const std::vector<std::string>& get_logic_table_names() const { return logic_table_names_; }
    const TableAndSchemaNameMapper& get_table_and_schema_name_mapper() const { return mapper_; }

    std::vector<QualifiedTable> get_qualified_tables() const;

private:
    std::vector<std::string> logic_table_names_;
    TableAndSchemaNameMapper mapper_;
};
