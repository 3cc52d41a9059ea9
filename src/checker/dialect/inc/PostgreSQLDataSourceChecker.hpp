#pragma once

#include "DialectDataSourceChecker.hpp"

// Logical decoding needs a superuser or a role with REPLICATION, and wal_level = logical.
// Also used for openGauss.
class PostgreSQLDataSourceChecker : public DialectDataSourceChecker {
public:
    static constexpr const char* SHOW_ROLE_SQL =
        "SELECT rolsuper, rolreplication FROM pg_roles WHERE rolname = current_user";
    static constexpr const char* SHOW_WAL_LEVEL_SQL = "SHOW wal_level";

    void check_privilege(DataSource& data_source) const override;
    void check_variable(DataSource& data_source) const override;
};
