#pragma once

#include "DataSource.hpp"
#include "DataSourceConfig.hpp"
#include <sqlite3.h>
#include <memory>
#include <string>

class SQLiteResultSet : public ResultSet {
public:
    SQLiteResultSet(sqlite3* db, sqlite3_stmt* stmt);
    ~SQLiteResultSet() override;

    bool next() override;
    size_t column_count() const override;
    bool is_null(size_t column) const override;
    std::string get_string(size_t column) const override;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    bool done_ = false;
};

class SQLiteStatement : public PreparedStatement {
public:
    SQLiteStatement(sqlite3* db, const std::string& sql);
    ~SQLiteStatement() override;

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    std::unique_ptr<ResultSet> execute_query() override;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

class SQLiteConnection : public DatabaseConnection {
public:
    SQLiteConnection(const std::string& url, int open_flags);
    ~SQLiteConnection() override;

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    std::unique_ptr<PreparedStatement> prepare_statement(const std::string& sql) override;

    void close() noexcept override;
    bool is_closed() const override { return db_ == nullptr; }

private:
    sqlite3* db_{nullptr};
};

// url is a database file path or a "file:" URI. Connections are opened read-only,
// so a missing database file fails instead of being created.
class SQLiteDataSource : public DataSource {
public:
    explicit SQLiteDataSource(const DataSourceConfig& config);

    std::unique_ptr<DatabaseConnection> get_connection() override;

    DatabaseType get_database_type() const override { return DatabaseType::SQLITE; }
    std::string get_data_source_info() const override;

private:
    DataSourceConfig config_;
};

void register_sqlite_data_source();
