#pragma once
#include "DialectDataSourceChecker.hpp"
#include "DatabaseType.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

class DialectDataSourceCheckerFactory {
public:
    using Builder = std::function<std::unique_ptr<DialectDataSourceChecker>()>;

    static DialectDataSourceCheckerFactory& instance();

    static void register_checker(DatabaseType type, Builder builder);

    // Null when the dialect has no extra rules
    static std::unique_ptr<DialectDataSourceChecker> find_checker(DatabaseType type);

private:
    DialectDataSourceCheckerFactory();

    std::unordered_map<DatabaseType, Builder> builders_;
    std::mutex mutex_;
};
