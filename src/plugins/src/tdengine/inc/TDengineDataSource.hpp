#pragma once

#include "DataSource.hpp"
#include "DataSourceConfig.hpp"
#include "TDengineDsn.hpp"
#include "TaosDriver.hpp"
#include <memory>
#include <string>

class TDengineResultSet : public ResultSet {
public:
    TDengineResultSet(std::shared_ptr<const TaosDriver> driver, TAOS_RES* result);
    ~TDengineResultSet() override;

    TDengineResultSet(const TDengineResultSet&) = delete;
    TDengineResultSet& operator=(const TDengineResultSet&) = delete;

    bool next() override;
    size_t column_count() const override { return num_fields_; }
    bool is_null(size_t column) const override;
    std::string get_string(size_t column) const override;

private:
    void check_position(size_t column) const;

    std::shared_ptr<const TaosDriver> driver_;
    TAOS_RES* result_;
    TAOS_FIELD* fields_{nullptr};
    size_t num_fields_{0};
    TAOS_ROW row_{nullptr};
    int* lengths_{nullptr};
};

class TDengineStatement : public PreparedStatement {
public:
    TDengineStatement(std::shared_ptr<const TaosDriver> driver, TAOS* conn, std::string sql);

    std::unique_ptr<ResultSet> execute_query() override;

private:
    std::shared_ptr<const TaosDriver> driver_;
    TAOS* conn_;
    std::string sql_;
};

class TDengineConnection : public DatabaseConnection {
public:
    TDengineConnection(std::shared_ptr<const TaosDriver> driver, const TDengineDsn& dsn);
    ~TDengineConnection() override;

    TDengineConnection(const TDengineConnection&) = delete;
    TDengineConnection& operator=(const TDengineConnection&) = delete;

    std::unique_ptr<PreparedStatement> prepare_statement(const std::string& sql) override;

    void close() noexcept override;
    bool is_closed() const override { return conn_ == nullptr; }

private:
    std::shared_ptr<const TaosDriver> driver_;
    TAOS* conn_{nullptr};
};

// url is a taos:// or taos+ws:// DSN. Non-empty user and password in the
// config take precedence over the credentials in the DSN. libtaos is loaded
// on the first connection attempt.
class TDengineDataSource : public DataSource {
public:
    explicit TDengineDataSource(const DataSourceConfig& config);

    std::unique_ptr<DatabaseConnection> get_connection() override;

    DatabaseType get_database_type() const override { return DatabaseType::TDENGINE; }
    std::string get_data_source_info() const override;

    const TDengineDsn& get_dsn() const { return dsn_; }

private:
    TDengineDsn dsn_;
};

void register_tdengine_data_source();
