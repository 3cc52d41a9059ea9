#pragma once
#include "DataSource.hpp"
#include "DataSourceConfig.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

class DataSourceFactory {
public:
    using Builder = std::function<std::unique_ptr<DataSource>(const DataSourceConfig&)>;

    static DataSourceFactory& instance() {
        static DataSourceFactory inst;
        return inst;
    }

    static void register_data_source(DatabaseType type, Builder builder) {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.builders_[type] = std::move(builder);
    }

    static bool is_registered(DatabaseType type) {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        return inst.builders_.count(type) != 0;
    }

    static std::unique_ptr<DataSource> create(const DataSourceConfig& config) {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        if (auto it = inst.builders_.find(config.type); it != inst.builders_.end()) {
            return it->second(config);
        }
        throw std::invalid_argument(std::string("Unsupported data source type: ") + database_type_to_string(config.type));
    }

private:
    std::unordered_map<DatabaseType, Builder> builders_;
    std::mutex mutex_;
};
