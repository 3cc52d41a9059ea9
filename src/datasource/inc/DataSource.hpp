#pragma once

#include "DatabaseType.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Handles below are owned through std::unique_ptr and release their native
// resource in the destructor. A result set must not outlive its statement,
// and a statement must not outlive its connection.

class ResultSet {
public:
    virtual ~ResultSet() = default;

    // Advances to the next row, false once the rows are exhausted
    virtual bool next() = 0;

    // Column access on the current row, 0-based
    virtual size_t column_count() const = 0;
    virtual bool is_null(size_t column) const = 0;
    virtual std::string get_string(size_t column) const = 0;
};

class PreparedStatement {
public:
    virtual ~PreparedStatement() = default;

    virtual std::unique_ptr<ResultSet> execute_query() = 0;
};

class DatabaseConnection {
public:
    virtual ~DatabaseConnection() = default;

    virtual std::unique_ptr<PreparedStatement> prepare_statement(const std::string& sql) = 0;

    virtual void close() noexcept = 0;
    virtual bool is_closed() const = 0;
};

class DataSource {
public:
    virtual ~DataSource() = default;

    // Opens a new connection, throws SQLException when the database cannot be reached
    virtual std::unique_ptr<DatabaseConnection> get_connection() = 0;

    virtual DatabaseType get_database_type() const = 0;

    // Human-readable target, never includes credentials
    virtual std::string get_data_source_info() const = 0;
};

using DataSourceRefs = std::vector<std::reference_wrapper<DataSource>>;
