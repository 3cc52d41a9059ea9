#pragma once

#include "DialectDataSourceChecker.hpp"
#include <string>
#include <utility>
#include <vector>

// Binlog based capture needs replication rights on *.* and row-based binlog with full images.
// Also used for MariaDB.
class MySQLDataSourceChecker : public DialectDataSourceChecker {
public:
    static constexpr const char* SHOW_GRANTS_SQL = "SHOW GRANTS";

    void check_privilege(DataSource& data_source) const override;
    void check_variable(DataSource& data_source) const override;

    static const std::vector<std::string>& required_privileges();
    static const std::vector<std::pair<std::string, std::string>>& required_variables();

    static std::string build_show_variable_sql(const std::string& variable_name);

private:
    static std::vector<std::string> missing_privileges(const std::vector<std::string>& grants);
};
