#include "TDengineDataSource.hpp"
#include "SQLException.hpp"
#include "LogUtils.hpp"
#include <cstring>
#include <stdexcept>

namespace {

std::string format_value(const TAOS_FIELD& field, const void* value, int length) {
    switch (field.type) {
        case TSDB_DATA_TYPE_BOOL:
            return *static_cast<const int8_t*>(value) ? "true" : "false";
        case TSDB_DATA_TYPE_TINYINT:
            return std::to_string(*static_cast<const int8_t*>(value));
        case TSDB_DATA_TYPE_UTINYINT:
            return std::to_string(*static_cast<const uint8_t*>(value));
        case TSDB_DATA_TYPE_SMALLINT:
            return std::to_string(*static_cast<const int16_t*>(value));
        case TSDB_DATA_TYPE_USMALLINT:
            return std::to_string(*static_cast<const uint16_t*>(value));
        case TSDB_DATA_TYPE_INT:
            return std::to_string(*static_cast<const int32_t*>(value));
        case TSDB_DATA_TYPE_UINT:
            return std::to_string(*static_cast<const uint32_t*>(value));
        case TSDB_DATA_TYPE_BIGINT:
        case TSDB_DATA_TYPE_TIMESTAMP:
            return std::to_string(*static_cast<const int64_t*>(value));
        case TSDB_DATA_TYPE_UBIGINT:
            return std::to_string(*static_cast<const uint64_t*>(value));
        case TSDB_DATA_TYPE_FLOAT: {
            float f;
            std::memcpy(&f, value, sizeof(f));
            return std::to_string(f);
        }
        case TSDB_DATA_TYPE_DOUBLE: {
            double d;
            std::memcpy(&d, value, sizeof(d));
            return std::to_string(d);
        }
        default:
            // VARCHAR, NCHAR, JSON, VARBINARY, GEOMETRY
            return std::string(static_cast<const char*>(value), static_cast<size_t>(length));
    }
}

}

TDengineResultSet::TDengineResultSet(std::shared_ptr<const TaosDriver> driver, TAOS_RES* result)
    : driver_(std::move(driver)), result_(result) {
    num_fields_ = static_cast<size_t>(driver_->taos_num_fields(result_));
    fields_ = driver_->taos_fetch_fields(result_);
}

TDengineResultSet::~TDengineResultSet() {
    driver_->taos_free_result(result_);
}

bool TDengineResultSet::next() {
    row_ = driver_->taos_fetch_row(result_);
    if (!row_) {
        const int code = driver_->taos_errno(result_);
        if (code != 0) {
            throw SQLException(std::string("TDengine fetch failed: ") + driver_->taos_errstr(result_), code);
        }
        lengths_ = nullptr;
        return false;
    }
    lengths_ = driver_->taos_fetch_lengths(result_);
    return true;
}

void TDengineResultSet::check_position(size_t column) const {
    if (!row_) {
        throw std::out_of_range("Result set is not positioned on a row");
    }
    if (column >= num_fields_) {
        throw std::out_of_range("Column index out of range: " + std::to_string(column));
    }
}

bool TDengineResultSet::is_null(size_t column) const {
    check_position(column);
    return row_[column] == nullptr;
}

std::string TDengineResultSet::get_string(size_t column) const {
    check_position(column);
    if (!row_[column]) {
        return {};
    }
    const int length = lengths_ ? lengths_[column] : 0;
    return format_value(fields_[column], row_[column], length);
}

TDengineStatement::TDengineStatement(std::shared_ptr<const TaosDriver> driver, TAOS* conn, std::string sql)
    : driver_(std::move(driver)), conn_(conn), sql_(std::move(sql)) {}

std::unique_ptr<ResultSet> TDengineStatement::execute_query() {
    TAOS_RES* res = driver_->taos_query(conn_, sql_.c_str());
    const int code = driver_->taos_errno(res);
    if (code != 0) {
        SQLException error(std::string("TDengine execute failed: ") + driver_->taos_errstr(res) + ", SQL: " + sql_,
                           code);
        driver_->taos_free_result(res);
        throw error;
    }
    return std::make_unique<TDengineResultSet>(driver_, res);
}

TDengineConnection::TDengineConnection(std::shared_ptr<const TaosDriver> driver, const TDengineDsn& dsn)
    : driver_(std::move(driver)) {
    conn_ = driver_->taos_connect(
        dsn.host.c_str(),
        dsn.user.c_str(),
        dsn.password.c_str(),
        dsn.database.empty() ? nullptr : dsn.database.c_str(),
        static_cast<uint16_t>(dsn.port)
    );

    if (!conn_) {
        throw SQLException(std::string("TDengine connection failed: ") + driver_->taos_errstr(nullptr) +
                               " (host: " + dsn.get_address() + ", user: " + dsn.user +
                               ", database: " + dsn.database + ")",
                           driver_->taos_errno(nullptr));
    }
}

TDengineConnection::~TDengineConnection() {
    close();
}

std::unique_ptr<PreparedStatement> TDengineConnection::prepare_statement(const std::string& sql) {
    if (!conn_) {
        throw SQLException("TDengine connection is closed");
    }
    return std::make_unique<TDengineStatement>(driver_, conn_, sql);
}

void TDengineConnection::close() noexcept {
    if (conn_) {
        driver_->taos_close(conn_);
        conn_ = nullptr;
    }
}

TDengineDataSource::TDengineDataSource(const DataSourceConfig& config) : dsn_(TDengineDsn::parse(config.url)) {
    if (!config.user.empty()) {
        dsn_.user = config.user;
    }
    if (!config.password.empty()) {
        dsn_.password = config.password;
    }
}

std::unique_ptr<DatabaseConnection> TDengineDataSource::get_connection() {
    LogUtils::debug("Connecting to {}", get_data_source_info());
    return std::make_unique<TDengineConnection>(TaosDriver::load(dsn_.driver_type()), dsn_);
}

std::string TDengineDataSource::get_data_source_info() const {
    return "TDengine(" + dsn_.get_address() + ")";
}
