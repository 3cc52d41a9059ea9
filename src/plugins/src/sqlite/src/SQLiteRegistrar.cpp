#include "SQLiteDataSource.hpp"
#include "DataSourceFactory.hpp"

void register_sqlite_data_source() {
    DataSourceFactory::register_data_source(DatabaseType::SQLITE,
        [](const DataSourceConfig& config) -> std::unique_ptr<DataSource> {
            return std::make_unique<SQLiteDataSource>(config);
        });
}

namespace {

const bool registered = (register_sqlite_data_source(), true);

}
