#include "PostgreSQLDataSource.hpp"
#include "SQLException.hpp"
#include "StringUtils.hpp"
#include "LogUtils.hpp"
#include <stdexcept>
#include <vector>

namespace {

std::string trimmed_error(const char* message) {
    return StringUtils::trimmed(message ? message : "unknown error");
}

}

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* result) : result_(result) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    PQclear(result_);
}

bool PostgreSQLResultSet::next() {
    if (row_ + 1 >= PQntuples(result_)) {
        row_ = PQntuples(result_);
        return false;
    }
    row_++;
    return true;
}

size_t PostgreSQLResultSet::column_count() const {
    return static_cast<size_t>(PQnfields(result_));
}

void PostgreSQLResultSet::check_position(size_t column) const {
    if (row_ < 0 || row_ >= PQntuples(result_)) {
        throw std::out_of_range("Result set is not positioned on a row");
    }
    if (column >= column_count()) {
        throw std::out_of_range("Column index out of range: " + std::to_string(column));
    }
}

bool PostgreSQLResultSet::is_null(size_t column) const {
    check_position(column);
    return PQgetisnull(result_, row_, static_cast<int>(column)) == 1;
}

std::string PostgreSQLResultSet::get_string(size_t column) const {
    check_position(column);
    const int col = static_cast<int>(column);
    return std::string(PQgetvalue(result_, row_, col), static_cast<size_t>(PQgetlength(result_, row_, col)));
}

PostgreSQLStatement::PostgreSQLStatement(PGconn* conn, std::string sql) : conn_(conn), sql_(std::move(sql)) {}

std::unique_ptr<ResultSet> PostgreSQLStatement::execute_query() {
    PGresult* result = PQexec(conn_, sql_.c_str());
    const ExecStatusType status = PQresultStatus(result);
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        const char* state = result ? PQresultErrorField(result, PG_DIAG_SQLSTATE) : nullptr;
        SQLException error("PostgreSQL execute failed: " + trimmed_error(PQerrorMessage(conn_)) + ", SQL: " + sql_,
                           static_cast<int>(status), state ? state : "");
        PQclear(result);
        throw error;
    }
    return std::make_unique<PostgreSQLResultSet>(result);
}

PostgreSQLConnection::PostgreSQLConnection(const DataSourceConfig& config) {
    std::vector<const char*> keywords{"dbname"};
    std::vector<const char*> values{config.url.c_str()};
    if (!config.user.empty()) {
        keywords.push_back("user");
        values.push_back(config.user.c_str());
    }
    if (!config.password.empty()) {
        keywords.push_back("password");
        values.push_back(config.password.c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    conn_ = PQconnectdbParams(keywords.data(), values.data(), 1);
    if (!conn_) {
        throw SQLException("PostgreSQL connection failed: out of memory", 0, "08001");
    }
    if (PQstatus(conn_) != CONNECTION_OK) {
        SQLException error("PostgreSQL connection failed: " + trimmed_error(PQerrorMessage(conn_)), 0, "08001");
        close();
        throw error;
    }
}

PostgreSQLConnection::~PostgreSQLConnection() {
    close();
}

std::unique_ptr<PreparedStatement> PostgreSQLConnection::prepare_statement(const std::string& sql) {
    if (!conn_) {
        throw SQLException("PostgreSQL connection is closed", 0, "08003");
    }
    return std::make_unique<PostgreSQLStatement>(conn_, sql);
}

void PostgreSQLConnection::close() noexcept {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

PostgreSQLDataSource::PostgreSQLDataSource(const DataSourceConfig& config) : config_(config) {
    if (config_.type != DatabaseType::POSTGRESQL && config_.type != DatabaseType::OPENGAUSS) {
        throw std::invalid_argument(std::string("PostgreSQL data source cannot serve ") +
                                    database_type_to_string(config_.type));
    }
}

std::unique_ptr<DatabaseConnection> PostgreSQLDataSource::get_connection() {
    LogUtils::debug("Connecting to {}", get_data_source_info());
    return std::make_unique<PostgreSQLConnection>(config_);
}

std::string PostgreSQLDataSource::get_data_source_info() const {
    return config_.get_data_source_info();
}
