#include "TDengineDataSource.hpp"
#include "DataSourceFactory.hpp"

void register_tdengine_data_source() {
    DataSourceFactory::register_data_source(DatabaseType::TDENGINE,
        [](const DataSourceConfig& config) -> std::unique_ptr<DataSource> {
            return std::make_unique<TDengineDataSource>(config);
        });
}

namespace {

const bool registered = (register_tdengine_data_source(), true);

}
