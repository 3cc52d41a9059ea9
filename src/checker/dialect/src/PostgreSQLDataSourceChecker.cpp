#include "PostgreSQLDataSourceChecker.hpp"
#include "PipelineJobExceptions.hpp"
#include "SQLException.hpp"
#include "StringUtils.hpp"
#include <string>

namespace {

bool is_true(const std::string& value) {
    const std::string lower = StringUtils::to_lower(value);
    return lower == "t" || lower == "true" || lower == "on" || lower == "1";
}

}

void PostgreSQLDataSourceChecker::check_privilege(DataSource& data_source) const {
    bool granted = false;
    try {
        auto connection = data_source.get_connection();
        auto statement = connection->prepare_statement(SHOW_ROLE_SQL);
        auto result_set = statement->execute_query();
        if (result_set->next()) {
            granted = is_true(result_set->get_string(0)) || is_true(result_set->get_string(1));
        }
    } catch (const SQLException& e) {
        throw CheckPrivilegeFailedException(e);
    }

    if (!granted) {
        throw MissingRequiredPrivilegeException({"REPLICATION"});
    }
}

void PostgreSQLDataSourceChecker::check_variable(DataSource& data_source) const {
    std::string wal_level;
    try {
        auto connection = data_source.get_connection();
        auto statement = connection->prepare_statement(SHOW_WAL_LEVEL_SQL);
        auto result_set = statement->execute_query();
        if (result_set->next()) {
            wal_level = result_set->get_string(0);
        }
    } catch (const SQLException& e) {
        throw CheckVariableFailedException(e);
    }

    if (!StringUtils::equals_ignore_case(wal_level, "logical")) {
        throw UnexpectedVariableValueException("wal_level", "logical", wal_level);
    }
}
