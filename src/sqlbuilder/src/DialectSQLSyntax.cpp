#include "DialectSQLSyntax.hpp"
#include <stdexcept>

std::string DialectSQLSyntax::quote(const std::string& identifier) const {
    if (identifier.find('\0') != std::string::npos) {
        throw std::invalid_argument("Identifier contains a NUL character");
    }

    std::string quoted;
    quoted.reserve(identifier.size() + 2);
    quoted.push_back(quote_begin);
    for (char c : identifier) {
        quoted.push_back(c);
        if (c == quote_end) {
            quoted.push_back(c);
        }
    }
    quoted.push_back(quote_end);
    return quoted;
}

const DialectSQLSyntax& get_dialect_sql_syntax(DatabaseType type) {
    static const DialectSQLSyntax backtick_no_schema{'`', '`', false, RowLimitStyle::LIMIT};
    static const DialectSQLSyntax backtick{'`', '`', true, RowLimitStyle::LIMIT};
    static const DialectSQLSyntax standard{'"', '"', true, RowLimitStyle::LIMIT};
    static const DialectSQLSyntax oracle{'"', '"', true, RowLimitStyle::ROWNUM};
    static const DialectSQLSyntax sqlserver{'[', ']', true, RowLimitStyle::TOP};

    switch (type) {
        case DatabaseType::MYSQL:
        case DatabaseType::MARIADB:
            return backtick_no_schema;
        case DatabaseType::TDENGINE:
            return backtick;
        case DatabaseType::ORACLE:
            return oracle;
        case DatabaseType::SQLSERVER:
            return sqlserver;
        case DatabaseType::POSTGRESQL:
        case DatabaseType::OPENGAUSS:
        case DatabaseType::H2:
        case DatabaseType::SQLITE:
            return standard;
    }
    throw std::invalid_argument("No SQL syntax for database type: " + std::to_string(static_cast<int>(type)));
}
