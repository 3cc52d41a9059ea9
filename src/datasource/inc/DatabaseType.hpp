#pragma once

#include <string>

enum class DatabaseType {
    MYSQL,
    MARIADB,
    POSTGRESQL,
    OPENGAUSS,
    ORACLE,
    SQLSERVER,
    H2,
    SQLITE,
    TDENGINE
};

const char* database_type_to_string(DatabaseType type);

DatabaseType string_to_database_type(const std::string& str);
