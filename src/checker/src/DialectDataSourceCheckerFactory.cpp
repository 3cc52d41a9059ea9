#include "DialectDataSourceCheckerFactory.hpp"
#include "MySQLDataSourceChecker.hpp"
#include "PostgreSQLDataSourceChecker.hpp"

DialectDataSourceCheckerFactory::DialectDataSourceCheckerFactory() {
    Builder mysql = [] { return std::make_unique<MySQLDataSourceChecker>(); };
    Builder postgresql = [] { return std::make_unique<PostgreSQLDataSourceChecker>(); };

    builders_[DatabaseType::MYSQL] = mysql;
    builders_[DatabaseType::MARIADB] = mysql;
    builders_[DatabaseType::POSTGRESQL] = postgresql;
    builders_[DatabaseType::OPENGAUSS] = postgresql;
}

DialectDataSourceCheckerFactory& DialectDataSourceCheckerFactory::instance() {
    static DialectDataSourceCheckerFactory inst;
    return inst;
}

void DialectDataSourceCheckerFactory::register_checker(DatabaseType type, Builder builder) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(inst.mutex_);
    inst.builders_[type] = std::move(builder);
}

std::unique_ptr<DialectDataSourceChecker> DialectDataSourceCheckerFactory::find_checker(DatabaseType type) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(inst.mutex_);
    if (auto it = inst.builders_.find(type); it != inst.builders_.end()) {
        return it->second();
    }
    return nullptr;
}
