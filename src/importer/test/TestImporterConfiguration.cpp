#include "ImporterConfiguration.hpp"
#include <cassert>
#include <iostream>
#include <map>
#include <stdexcept>

void test_mapper_from_map() {
    TableAndSchemaNameMapper mapper(std::map<std::string, std::string>{{"Orders", "s"}, {"items", "public"}});
    assert(mapper.size() == 2);
    assert(mapper.get_schema_name("orders") == "s");
    assert(mapper.get_schema_name("ORDERS") == "s");
    assert(mapper.get_schema_name("items") == "public");
    assert(mapper.get_schema_name("unknown").empty());
    std::cout << "test_mapper_from_map passed" << std::endl;
}

void test_mapper_from_qualified_names() {
    TableAndSchemaNameMapper mapper(std::vector<std::string>{"public.t_order", "t_item"});
    assert(mapper.get_schema_name("t_order") == "public");
    assert(mapper.get_schema_name("t_item").empty());

    bool thrown = false;
    try {
        TableAndSchemaNameMapper bad(std::vector<std::string>{"a.b.c"});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_mapper_from_qualified_names passed" << std::endl;
}

void test_importer_keeps_order_and_dedups() {
    ImporterConfiguration config(std::vector<std::string>{"s.orders", "items", "S.ORDERS", "s.users"});
    const auto& names = config.get_logic_table_names();
    assert(names.size() == 3);
    assert(names[0] == "orders");
    assert(names[1] == "items");
    assert(names[2] == "users");
    assert(config.get_table_and_schema_name_mapper().get_schema_name("users") == "s");

    auto tables = config.get_qualified_tables();
    assert(tables.size() == 3);
    assert(tables[0].to_string() == "s.orders");
    assert(tables[1].to_string() == "items");
    std::cout << "test_importer_keeps_order_and_dedups passed" << std::endl;
}

void test_importer_with_explicit_mapper() {
    TableAndSchemaNameMapper mapper(std::map<std::string, std::string>{{"orders", "sales"}});
    ImporterConfiguration config({"orders", "Orders", "refunds"}, mapper);
    assert(config.get_logic_table_names().size() == 2);
    assert(config.get_qualified_tables()[0].to_string() == "sales.orders");
    assert(config.get_qualified_tables()[1].to_string() == "refunds");
    std::cout << "test_importer_with_explicit_mapper passed" << std::endl;
}

void test_same_table_in_two_schemas_rejected() {
    bool thrown = false;
    try {
        ImporterConfiguration config(std::vector<std::string>{"s1.orders", "items", "s2.ORDERS"});
    } catch (const std::invalid_argument& e) {
        thrown = std::string(e.what()).find("more than one schema") != std::string::npos;
    }
    assert(thrown);

    thrown = false;
    try {
        TableAndSchemaNameMapper::validate({"orders", "sales.orders"});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        TableAndSchemaNameMapper mapper(std::map<std::string, std::string>{{"Orders", "s1"}, {"orders", "s2"}});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    // Same schema spelled with a different case is one table
    TableAndSchemaNameMapper::validate({"Sales.orders", "sales.ORDERS"});
    std::cout << "test_same_table_in_two_schemas_rejected passed" << std::endl;
}

int main() {
    test_mapper_from_map();
    test_mapper_from_qualified_names();
    test_importer_keeps_order_and_dedups();
    test_importer_with_explicit_mapper();
    test_same_table_in_two_schemas_rejected();

    std::cout << "All ImporterConfiguration tests passed!" << std::endl;
    return 0;
}
