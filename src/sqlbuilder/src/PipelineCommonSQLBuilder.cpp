#include "PipelineCommonSQLBuilder.hpp"
#include <stdexcept>

PipelineCommonSQLBuilder::PipelineCommonSQLBuilder(DatabaseType database_type)
    : database_type_(database_type), syntax_(get_dialect_sql_syntax(database_type)) {}

std::string PipelineCommonSQLBuilder::build_qualified_table_name(const std::string& schema_name,
                                                                 const std::string& table_name) const {
    if (table_name.empty()) {
        throw std::invalid_argument("Table name must not be empty");
    }
    if (syntax_.schema_available && !schema_name.empty()) {
        return syntax_.quote(schema_name) + "." + syntax_.quote(table_name);
    }
    return syntax_.quote(table_name);
}

std::string PipelineCommonSQLBuilder::build_check_empty_sql(const std::string& schema_name,
                                                            const std::string& table_name) const {
    const std::string qualified_table_name = build_qualified_table_name(schema_name, table_name);
    switch (syntax_.row_limit) {
        case RowLimitStyle::ROWNUM:
            return "SELECT 1 FROM " + qualified_table_name + " WHERE ROWNUM = 1";
        case RowLimitStyle::TOP:
            return "SELECT TOP 1 1 FROM " + qualified_table_name;
        case RowLimitStyle::LIMIT:
        default:
            return "SELECT 1 FROM " + qualified_table_name + " LIMIT 1";
    }
}
