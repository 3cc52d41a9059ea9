#pragma once

#include "DatabaseType.hpp"
#include <string>

enum class RowLimitStyle {
    LIMIT,      // SELECT ... LIMIT 1
    ROWNUM,     // SELECT ... WHERE ROWNUM = 1
    TOP         // SELECT TOP 1 ...
};

struct DialectSQLSyntax {
    char quote_begin = '"';
    char quote_end = '"';
    bool schema_available = true;
    RowLimitStyle row_limit = RowLimitStyle::LIMIT;

    // Wraps identifier in the dialect quotes, doubling any embedded closing quote
    std::string quote(const std::string& identifier) const;
};

const DialectSQLSyntax& get_dialect_sql_syntax(DatabaseType type);
