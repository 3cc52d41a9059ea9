#include "DatabaseType.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

const char* database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::MYSQL:      return "MySQL";
        case DatabaseType::MARIADB:    return "MariaDB";
        case DatabaseType::POSTGRESQL: return "PostgreSQL";
        case DatabaseType::OPENGAUSS:  return "openGauss";
        case DatabaseType::ORACLE:     return "Oracle";
        case DatabaseType::SQLSERVER:  return "SQLServer";
        case DatabaseType::H2:         return "H2";
        case DatabaseType::SQLITE:     return "SQLite";
        case DatabaseType::TDENGINE:   return "TDengine";
        default: return "UNKNOWN";
    }
}

DatabaseType string_to_database_type(const std::string& str) {
    std::string s = StringUtils::to_upper(StringUtils::trimmed(str));
    if (s == "MYSQL")      return DatabaseType::MYSQL;
    if (s == "MARIADB")    return DatabaseType::MARIADB;
    if (s == "POSTGRESQL" || s == "POSTGRES") return DatabaseType::POSTGRESQL;
    if (s == "OPENGAUSS")  return DatabaseType::OPENGAUSS;
    if (s == "ORACLE")     return DatabaseType::ORACLE;
    if (s == "SQLSERVER" || s == "SQL SERVER" || s == "MSSQL") return DatabaseType::SQLSERVER;
    if (s == "H2")         return DatabaseType::H2;
    if (s == "SQLITE")     return DatabaseType::SQLITE;
    if (s == "TDENGINE")   return DatabaseType::TDENGINE;
    throw std::invalid_argument("Unknown database type: " + str);
}
