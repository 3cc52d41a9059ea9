#pragma once

#include "DataSource.hpp"
#include "DataSourceConfig.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

class PostgreSQLResultSet : public ResultSet {
public:
    explicit PostgreSQLResultSet(PGresult* result);
    ~PostgreSQLResultSet() override;

    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    bool next() override;
    size_t column_count() const override;
    bool is_null(size_t column) const override;
    std::string get_string(size_t column) const override;

private:
    void check_position(size_t column) const;

    PGresult* result_;
    int row_ = -1;
};

class PostgreSQLStatement : public PreparedStatement {
public:
    PostgreSQLStatement(PGconn* conn, std::string sql);

    std::unique_ptr<ResultSet> execute_query() override;

private:
    PGconn* conn_;
    std::string sql_;
};

class PostgreSQLConnection : public DatabaseConnection {
public:
    explicit PostgreSQLConnection(const DataSourceConfig& config);
    ~PostgreSQLConnection() override;

    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    std::unique_ptr<PreparedStatement> prepare_statement(const std::string& sql) override;

    void close() noexcept override;
    bool is_closed() const override { return conn_ == nullptr; }

private:
    PGconn* conn_{nullptr};
};

// url is a libpq conninfo string ("host=... dbname=...") or a postgresql:// URI.
// Non-empty user and password in the config take precedence over the url.
// Serves PostgreSQL and openGauss.
class PostgreSQLDataSource : public DataSource {
public:
    explicit PostgreSQLDataSource(const DataSourceConfig& config);

    std::unique_ptr<DatabaseConnection> get_connection() override;

    DatabaseType get_database_type() const override { return config_.type; }
    std::string get_data_source_info() const override;

private:
    DataSourceConfig config_;
};

void register_postgresql_data_source();
