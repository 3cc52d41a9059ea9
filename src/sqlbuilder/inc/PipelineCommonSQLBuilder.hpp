#pragma once

#include "DatabaseType.hpp"
#include "DialectSQLSyntax.hpp"
#include <string>

class PipelineCommonSQLBuilder {
public:
    explicit PipelineCommonSQLBuilder(DatabaseType database_type);

    // "schema"."table", or just "table" when the schema is empty or the dialect has no schemas
    std::string build_qualified_table_name(const std::string& schema_name, const std::string& table_name) const;

    // Returns a query yielding one row when the table has data and no rows when it is empty.
    // Only a constant is selected, so no row content is transferred.
    std::string build_check_empty_sql(const std::string& schema_name, const std::string& table_name) const;

    DatabaseType get_database_type() const { return database_type_; }

private:
    DatabaseType database_type_;
    const DialectSQLSyntax& syntax_;
};
