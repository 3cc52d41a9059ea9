#include "PostgreSQLDataSource.hpp"
#include "DataSourceFactory.hpp"

void register_postgresql_data_source() {
    auto builder = [](const DataSourceConfig& config) -> std::unique_ptr<DataSource> {
        return std::make_unique<PostgreSQLDataSource>(config);
    };
    DataSourceFactory::register_data_source(DatabaseType::POSTGRESQL, builder);
    DataSourceFactory::register_data_source(DatabaseType::OPENGAUSS, builder);
}

namespace {

const bool registered = (register_postgresql_data_source(), true);

}
