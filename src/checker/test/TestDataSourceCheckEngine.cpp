#include "DataSourceCheckEngine.hpp"
#include "DialectDataSourceCheckerFactory.hpp"
#include "MySQLDataSourceChecker.hpp"
#include "PipelineJobExceptions.hpp"
#include "SQLException.hpp"
#include "DummyDataSource.hpp"
#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Records every call and fails for data sources whose info matches fail_on
struct RecordingChecker : public DialectDataSourceChecker {
    std::shared_ptr<std::vector<std::string>> calls;
    std::string fail_on;

    RecordingChecker(std::shared_ptr<std::vector<std::string>> c, std::string f)
        : calls(std::move(c)), fail_on(std::move(f)) {}

    void check_privilege(DataSource& data_source) const override {
        calls->push_back("privilege:" + data_source.get_data_source_info());
        if (data_source.get_data_source_info() == fail_on) {
            throw MissingRequiredPrivilegeException({"REPLICATION"});
        }
    }

    void check_variable(DataSource& data_source) const override {
        calls->push_back("variable:" + data_source.get_data_source_info());
        if (data_source.get_data_source_info() == fail_on) {
            throw UnexpectedVariableValueException("wal_level", "logical", "minimal");
        }
    }
};

std::shared_ptr<std::vector<std::string>> register_recording_checker(DatabaseType type, const std::string& fail_on) {
    auto calls = std::make_shared<std::vector<std::string>>();
    DialectDataSourceCheckerFactory::register_checker(type, [calls, fail_on] {
        return std::make_unique<RecordingChecker>(calls, fail_on);
    });
    return calls;
}

void test_builtin_checker_lookup() {
    assert(DataSourceCheckEngine(DatabaseType::MYSQL).has_dialect_checker());
    assert(DataSourceCheckEngine(DatabaseType::MARIADB).has_dialect_checker());
    assert(DataSourceCheckEngine(DatabaseType::POSTGRESQL).has_dialect_checker());
    assert(DataSourceCheckEngine(DatabaseType::OPENGAUSS).has_dialect_checker());
    assert(!DataSourceCheckEngine(DatabaseType::SQLITE).has_dialect_checker());
    assert(!DataSourceCheckEngine(DatabaseType::H2).has_dialect_checker());
    assert(!DataSourceCheckEngine(DatabaseType::TDENGINE).has_dialect_checker());
    std::cout << "test_builtin_checker_lookup passed" << std::endl;
}

void test_dialect_without_checker_issues_no_queries() {
    auto db = std::make_shared<DummyDatabase>();
    DummyDataSource ds(DatabaseType::SQLITE, db);

    DataSourceCheckEngine engine(DatabaseType::SQLITE);
    engine.check_privilege({ds});
    engine.check_variable({ds});
    assert(db->connect_attempts == 0);
    assert(db->executed_sql.empty());
    std::cout << "test_dialect_without_checker_issues_no_queries passed" << std::endl;
}

void test_check_connection_success() {
    auto first = std::make_shared<DummyDatabase>();
    auto second = std::make_shared<DummyDatabase>();
    DummyDataSource ds1(DatabaseType::H2, first, "first");
    DummyDataSource ds2(DatabaseType::H2, second, "second");

    DataSourceCheckEngine engine(DatabaseType::H2);
    engine.check_connection({ds1, ds2});
    assert(first->connect_attempts == 1 && second->connect_attempts == 1);
    assert(first->all_released() && second->all_released());
    std::cout << "test_check_connection_success passed" << std::endl;
}

void test_check_connection_fail_fast() {
    auto first = std::make_shared<DummyDatabase>();
    auto broken = std::make_shared<DummyDatabase>();
    auto third = std::make_shared<DummyDatabase>();
    broken->fail_connect = true;
    DummyDataSource ds1(DatabaseType::H2, first, "first");
    DummyDataSource ds2(DatabaseType::H2, broken, "broken");
    DummyDataSource ds3(DatabaseType::H2, third, "third");

    DataSourceCheckEngine engine(DatabaseType::H2);
    bool thrown = false;
    try {
        engine.check_connection({ds1, ds2, ds3});
    } catch (const PrepareJobWithInvalidConnectionException& e) {
        thrown = true;
        assert(std::string(e.what()).find("Communications link failure (broken)") != std::string::npos);
        bool cause_is_sql_exception = false;
        try {
            std::rethrow_exception(e.cause());
        } catch (const SQLException& cause) {
            cause_is_sql_exception = cause.sql_state() == "08S01";
        }
        assert(cause_is_sql_exception);
    }
    assert(thrown);
    assert(first->connect_attempts == 1);
    assert(broken->connect_attempts == 1);
    assert(third->connect_attempts == 0);
    std::cout << "test_check_connection_fail_fast passed" << std::endl;
}

void test_check_target_table_all_empty() {
    auto db = std::make_shared<DummyDatabase>();
    DummyDataSource ds(DatabaseType::POSTGRESQL, db);
    TableAndSchemaNameMapper mapper(std::map<std::string, std::string>{{"orders", "s"}, {"items", "s"}});

    DataSourceCheckEngine engine(DatabaseType::POSTGRESQL);
    engine.check_target_table({ds}, mapper, {"orders", "items"});

    assert(db->executed_sql.size() == 2);
    assert(db->executed_sql[0] == "SELECT 1 FROM \"s\".\"orders\" LIMIT 1");
    assert(db->executed_sql[1] == "SELECT 1 FROM \"s\".\"items\" LIMIT 1");
    assert(db->connect_attempts == 2);
    assert(db->all_released());
    std::cout << "test_check_target_table_all_empty passed" << std::endl;
}

void test_check_target_table_not_empty_stops() {
    auto db = std::make_shared<DummyDatabase>();
    db->results["SELECT 1 FROM \"s\".\"orders\" LIMIT 1"] = {{"1"}};
    DummyDataSource ds(DatabaseType::POSTGRESQL, db);
    TableAndSchemaNameMapper mapper(std::map<std::string, std::string>{{"users", "s"}, {"orders", "s"}, {"items", "s"}});

    DataSourceCheckEngine engine(DatabaseType::POSTGRESQL);
    bool thrown = false;
    try {
        engine.check_target_table({ds}, mapper, {"users", "orders", "items"});
    } catch (const PrepareJobWithTargetTableNotEmptyException& e) {
        thrown = e.table_name() == "orders";
    }
    assert(thrown);
    assert(db->executed_sql.size() == 2);
    assert(db->executed_sql.back().find("orders") != std::string::npos);
    assert(db->all_released());
    std::cout << "test_check_target_table_not_empty_stops passed" << std::endl;
}

void test_check_target_table_sql_failure_is_invalid_connection() {
    auto db = std::make_shared<DummyDatabase>();
    db->failing_sql.insert("SELECT 1 FROM \"missing\" LIMIT 1");
    DummyDataSource ds(DatabaseType::SQLITE, db);

    DataSourceCheckEngine engine(DatabaseType::SQLITE);
    bool invalid_connection = false;
    bool not_empty = false;
    try {
        engine.check_target_table({ds}, TableAndSchemaNameMapper(), {"missing", "orders"});
    } catch (const PrepareJobWithInvalidConnectionException&) {
        invalid_connection = true;
    } catch (const PrepareJobWithTargetTableNotEmptyException&) {
        not_empty = true;
    }
    assert(invalid_connection && !not_empty);
    assert(db->executed_sql.empty());
    assert(db->all_released());
    std::cout << "test_check_target_table_sql_failure_is_invalid_connection passed" << std::endl;
}

void test_check_target_table_connection_failure() {
    auto db = std::make_shared<DummyDatabase>();
    db->fail_connect = true;
    DummyDataSource ds(DatabaseType::MYSQL, db);

    DataSourceCheckEngine engine(DatabaseType::MYSQL);
    bool thrown = false;
    try {
        engine.check_target_table({ds}, TableAndSchemaNameMapper(), {"t_order"});
    } catch (const PrepareJobWithInvalidConnectionException&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_check_target_table_connection_failure passed" << std::endl;
}

void test_check_target_table_multiple_data_sources() {
    auto first = std::make_shared<DummyDatabase>();
    auto second = std::make_shared<DummyDatabase>();
    second->results["SELECT 1 FROM `t_order` LIMIT 1"] = {{"1"}};
    DummyDataSource ds1(DatabaseType::MYSQL, first, "ds_0");
    DummyDataSource ds2(DatabaseType::MYSQL, second, "ds_1");

    DataSourceCheckEngine engine(DatabaseType::MYSQL);
    bool thrown = false;
    try {
        engine.check_target_table({ds1, ds2}, TableAndSchemaNameMapper(), {"t_order", "t_order_item"});
    } catch (const PrepareJobWithTargetTableNotEmptyException& e) {
        thrown = e.table_name() == "t_order";
    }
    assert(thrown);
    assert(first->executed_sql.size() == 2);
    assert(second->executed_sql.size() == 1);
    std::cout << "test_check_target_table_multiple_data_sources passed" << std::endl;
}

void test_privilege_and_variable_no_op_without_checker() {
    auto db = std::make_shared<DummyDatabase>();
    db->fail_connect = true;
    DummyDataSource ds(DatabaseType::SQLITE, db);

    DataSourceCheckEngine engine(DatabaseType::SQLITE);
    engine.check_privilege({ds});
    engine.check_variable({ds});
    engine.check_privilege({});
    engine.check_variable({});
    assert(db->connect_attempts == 0);
    std::cout << "test_privilege_and_variable_no_op_without_checker passed" << std::endl;
}

void test_checker_failure_propagates_unchanged() {
    auto calls = register_recording_checker(DatabaseType::SQLSERVER, "Dummy(second)");
    DummyDataSource ds1(DatabaseType::SQLSERVER, std::make_shared<DummyDatabase>(), "first");
    DummyDataSource ds2(DatabaseType::SQLSERVER, std::make_shared<DummyDatabase>(), "second");
    DummyDataSource ds3(DatabaseType::SQLSERVER, std::make_shared<DummyDatabase>(), "third");

    DataSourceCheckEngine engine(DatabaseType::SQLSERVER);
    assert(engine.has_dialect_checker());

    bool thrown = false;
    try {
        engine.check_privilege({ds1, ds2, ds3});
    } catch (const MissingRequiredPrivilegeException&) {
        thrown = true;
    }
    assert(thrown);
    assert(calls->size() == 2);
    assert((*calls)[0] == "privilege:Dummy(first)");
    assert((*calls)[1] == "privilege:Dummy(second)");

    calls->clear();
    thrown = false;
    try {
        engine.check_variable({ds1, ds2, ds3});
    } catch (const UnexpectedVariableValueException& e) {
        thrown = e.variable_name() == "wal_level";
    }
    assert(thrown);
    assert(calls->size() == 2);
    std::cout << "test_checker_failure_propagates_unchanged passed" << std::endl;
}

void test_checker_resolved_once_per_engine() {
    DataSourceCheckEngine before(DatabaseType::ORACLE);
    assert(!before.has_dialect_checker());

    auto calls = register_recording_checker(DatabaseType::ORACLE, "");
    DummyDataSource ds(DatabaseType::ORACLE, std::make_shared<DummyDatabase>());
    before.check_privilege({ds});
    assert(calls->empty());

    DataSourceCheckEngine after(DatabaseType::ORACLE);
    after.check_privilege({ds});
    assert(calls->size() == 1);
    std::cout << "test_checker_resolved_once_per_engine passed" << std::endl;
}

void test_check_source_data_source_order() {
    auto calls = register_recording_checker(DatabaseType::H2, "");
    auto db = std::make_shared<DummyDatabase>();
    DummyDataSource ds(DatabaseType::H2, db, "source");

    DataSourceCheckEngine engine(DatabaseType::H2);
    engine.check_source_data_source(ds);
    assert(db->connect_attempts == 1);
    assert(calls->size() == 2);
    assert((*calls)[0] == "privilege:Dummy(source)");
    assert((*calls)[1] == "variable:Dummy(source)");

    db->fail_connect = true;
    calls->clear();
    bool thrown = false;
    try {
        engine.check_source_data_source(ds);
    } catch (const PrepareJobWithInvalidConnectionException&) {
        thrown = true;
    }
    assert(thrown);
    assert(calls->empty());
    std::cout << "test_check_source_data_source_order passed" << std::endl;
}

void test_check_source_data_source_mysql() {
    auto db = std::make_shared<DummyDatabase>();
    db->results["SHOW GRANTS"] = {{"GRANT SELECT, REPLICATION SLAVE, REPLICATION CLIENT ON *.* TO `repl`@`%`"}};
    db->results[MySQLDataSourceChecker::build_show_variable_sql("LOG_BIN")] = {{"log_bin", "ON"}};
    db->results[MySQLDataSourceChecker::build_show_variable_sql("BINLOG_FORMAT")] = {{"binlog_format", "MIXED"}};
    db->results[MySQLDataSourceChecker::build_show_variable_sql("BINLOG_ROW_IMAGE")] = {{"binlog_row_image", "FULL"}};
    DummyDataSource ds(DatabaseType::MYSQL, db);

    DataSourceCheckEngine engine(DatabaseType::MYSQL);
    bool thrown = false;
    try {
        engine.check_source_data_source(ds);
    } catch (const UnexpectedVariableValueException& e) {
        thrown = e.variable_name() == "BINLOG_FORMAT" && e.actual_value() == "MIXED";
    }
    assert(thrown);
    assert(db->all_released());
    std::cout << "test_check_source_data_source_mysql passed" << std::endl;
}

void test_check_target_data_source() {
    auto db = std::make_shared<DummyDatabase>();
    db->results["SELECT 1 FROM \"s\".\"orders\" LIMIT 1"] = {{"1"}};
    DummyDataSource ds(DatabaseType::OPENGAUSS, db, "target");

    DataSourceCheckEngine engine(DatabaseType::OPENGAUSS);
    engine.check_target_data_source(ds, ImporterConfiguration(std::vector<std::string>{"s.items"}));
    assert(db->executed_sql.size() == 1);

    bool thrown = false;
    try {
        engine.check_target_data_source(ds, ImporterConfiguration(std::vector<std::string>{"s.items", "s.orders"}));
    } catch (const PrepareJobWithTargetTableNotEmptyException& e) {
        thrown = e.table_name() == "orders";
        assert(std::string(e.what()).find("orders") != std::string::npos);
    }
    assert(thrown);
    assert(db->all_released());
    std::cout << "test_check_target_data_source passed" << std::endl;
}

void test_check_target_data_source_unreachable() {
    auto db = std::make_shared<DummyDatabase>();
    db->fail_connect = true;
    DummyDataSource ds(DatabaseType::POSTGRESQL, db);

    DataSourceCheckEngine engine(DatabaseType::POSTGRESQL);
    bool thrown = false;
    try {
        engine.check_target_data_source(ds, ImporterConfiguration(std::vector<std::string>{"s.orders"}));
    } catch (const PrepareJobWithInvalidConnectionException&) {
        thrown = true;
    }
    assert(thrown);
    assert(db->connect_attempts == 1);
    assert(db->executed_sql.empty());
    std::cout << "test_check_target_data_source_unreachable passed" << std::endl;
}

void test_check_target_data_source_table_in_two_schemas() {
    auto db = std::make_shared<DummyDatabase>();
    db->results["SELECT 1 FROM \"s1\".\"orders\" LIMIT 1"] = {{"1"}};
    DummyDataSource ds(DatabaseType::POSTGRESQL, db, "target");
    DataSourceCheckEngine engine(DatabaseType::POSTGRESQL);

    // Listing one table under two schemas cannot silently skip the first schema
    bool rejected = false;
    try {
        engine.check_target_data_source(ds, ImporterConfiguration(std::vector<std::string>{"s1.orders", "s2.orders"}));
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    assert(db->connect_attempts == 0);

    bool thrown = false;
    try {
        engine.check_target_data_source(ds, ImporterConfiguration(std::vector<std::string>{"s2.items", "s1.orders"}));
    } catch (const PrepareJobWithTargetTableNotEmptyException& e) {
        thrown = e.table_name() == "orders";
    }
    assert(thrown);
    assert(db->executed_sql.size() == 2);
    assert(db->executed_sql[0] == "SELECT 1 FROM \"s2\".\"items\" LIMIT 1");
    assert(db->executed_sql[1] == "SELECT 1 FROM \"s1\".\"orders\" LIMIT 1");
    assert(db->all_released());
    std::cout << "test_check_target_data_source_table_in_two_schemas passed" << std::endl;
}

int main() {
    test_builtin_checker_lookup();
    test_dialect_without_checker_issues_no_queries();
    test_check_connection_success();
    test_check_connection_fail_fast();
    test_check_target_table_all_empty();
    test_check_target_table_not_empty_stops();
    test_check_target_table_sql_failure_is_invalid_connection();
    test_check_target_table_connection_failure();
    test_check_target_table_multiple_data_sources();
    test_privilege_and_variable_no_op_without_checker();
    test_checker_failure_propagates_unchanged();
    test_checker_resolved_once_per_engine();
    test_check_source_data_source_order();
    test_check_source_data_source_mysql();
    test_check_target_data_source();
    test_check_target_data_source_unreachable();
    test_check_target_data_source_table_in_two_schemas();

    std::cout << "All DataSourceCheckEngine tests passed!" << std::endl;
    return 0;
}
