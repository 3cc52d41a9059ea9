#include "MySQLDataSourceChecker.hpp"
#include "PipelineJobExceptions.hpp"
#include "SQLException.hpp"
#include "StringUtils.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace {

constexpr const char* GRANT_PREFIX = "GRANT ";
constexpr const char* ON_KEYWORD = " ON ";
constexpr const char* GLOBAL_SCOPE = "*.*";

// Privilege names of a "GRANT <privileges> ON *.* TO ..." line, empty for
// any other scope or for role grants
std::vector<std::string> global_privileges(const std::string& grant) {
    const std::string line = StringUtils::trimmed(grant);
    const std::string upper = StringUtils::to_upper(line);
    const size_t prefix_len = std::char_traits<char>::length(GRANT_PREFIX);
    if (upper.compare(0, prefix_len, GRANT_PREFIX) != 0) {
        return {};
    }
    const size_t on = upper.find(ON_KEYWORD, prefix_len);
    if (on == std::string::npos) {
        return {};
    }
    const std::string scope = StringUtils::trimmed(line.substr(on + std::char_traits<char>::length(ON_KEYWORD)));
    if (scope.compare(0, std::char_traits<char>::length(GLOBAL_SCOPE), GLOBAL_SCOPE) != 0) {
        return {};
    }

    std::vector<std::string> privileges;
    for (const auto& each : StringUtils::split(line.substr(prefix_len, on - prefix_len), ',')) {
        std::string privilege = StringUtils::trimmed(each);
        if (!privilege.empty()) {
            privileges.push_back(std::move(privilege));
        }
    }
    return privileges;
}

}

const std::vector<std::string>& MySQLDataSourceChecker::required_privileges() {
    static const std::vector<std::string> privileges = {"SELECT", "REPLICATION SLAVE", "REPLICATION CLIENT"};
    return privileges;
}

const std::vector<std::pair<std::string, std::string>>& MySQLDataSourceChecker::required_variables() {
    static const std::vector<std::pair<std::string, std::string>> variables = {
        {"LOG_BIN", "ON"},
        {"BINLOG_FORMAT", "ROW"},
        {"BINLOG_ROW_IMAGE", "FULL"}
    };
    return variables;
}

std::string MySQLDataSourceChecker::build_show_variable_sql(const std::string& variable_name) {
    return "SHOW VARIABLES LIKE '" + variable_name + "'";
}

std::vector<std::string> MySQLDataSourceChecker::missing_privileges(const std::vector<std::string>& grants) {
    std::vector<std::string> missing = required_privileges();
    for (const auto& grant : grants) {
        for (const auto& granted : global_privileges(grant)) {
            if (StringUtils::equals_ignore_case(granted, "ALL PRIVILEGES") ||
                StringUtils::equals_ignore_case(granted, "ALL")) {
                return {};
            }
            missing.erase(std::remove_if(missing.begin(), missing.end(), [&granted](const std::string& privilege) {
                return StringUtils::equals_ignore_case(granted, privilege);
            }), missing.end());
        }
    }
    return missing;
}

void MySQLDataSourceChecker::check_privilege(DataSource& data_source) const {
    std::vector<std::string> grants;
    try {
        auto connection = data_source.get_connection();
        auto statement = connection->prepare_statement(SHOW_GRANTS_SQL);
        auto result_set = statement->execute_query();
        while (result_set->next()) {
            grants.push_back(result_set->get_string(0));
        }
    } catch (const SQLException& e) {
        throw CheckPrivilegeFailedException(e);
    }

    auto missing = missing_privileges(grants);
    if (!missing.empty()) {
        throw MissingRequiredPrivilegeException(missing);
    }
    LogUtils::debug("{} has the required replication privileges", data_source.get_data_source_info());
}

void MySQLDataSourceChecker::check_variable(DataSource& data_source) const {
    std::vector<std::pair<std::string, std::string>> actual_values;
    try {
        auto connection = data_source.get_connection();
        for (const auto& [name, expected] : required_variables()) {
            auto statement = connection->prepare_statement(build_show_variable_sql(name));
            auto result_set = statement->execute_query();
            actual_values.emplace_back(name, result_set->next() ? result_set->get_string(1) : std::string());
        }
    } catch (const SQLException& e) {
        throw CheckVariableFailedException(e);
    }

    for (size_t i = 0; i < actual_values.size(); ++i) {
        const auto& expected = required_variables()[i].second;
        const auto& [name, actual] = actual_values[i];
        if (!StringUtils::equals_ignore_case(expected, actual)) {
            throw UnexpectedVariableValueException(name, expected, actual);
        }
    }
}
