#include "SQLiteDataSource.hpp"
#include "SQLException.hpp"
#include "LogUtils.hpp"
#include <stdexcept>

namespace {

SQLException sqlite_error(sqlite3* db, const std::string& context) {
    const int code = db ? sqlite3_extended_errcode(db) : SQLITE_ERROR;
    const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(code);
    return SQLException(context + ": " + msg, code);
}

}

SQLiteResultSet::SQLiteResultSet(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

SQLiteResultSet::~SQLiteResultSet() {
    // The statement stays owned by SQLiteStatement, only rewind it
    sqlite3_reset(stmt_);
}

bool SQLiteResultSet::next() {
    if (done_) return false;

    const int code = sqlite3_step(stmt_);
    if (code == SQLITE_ROW) {
        return true;
    }
    done_ = true;
    if (code == SQLITE_DONE) {
        return false;
    }
    throw sqlite_error(db_, "SQLite step failed");
}

size_t SQLiteResultSet::column_count() const {
    return static_cast<size_t>(sqlite3_column_count(stmt_));
}

bool SQLiteResultSet::is_null(size_t column) const {
    return sqlite3_column_type(stmt_, static_cast<int>(column)) == SQLITE_NULL;
}

std::string SQLiteResultSet::get_string(size_t column) const {
    if (column >= column_count()) {
        throw std::out_of_range("Column index out of range: " + std::to_string(column));
    }
    const unsigned char* text = sqlite3_column_text(stmt_, static_cast<int>(column));
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, static_cast<int>(column))));
}

SQLiteStatement::SQLiteStatement(sqlite3* db, const std::string& sql) : db_(db) {
    const int code = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (code != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw sqlite_error(db_, "SQLite prepare failed, SQL: " + sql);
    }
}

SQLiteStatement::~SQLiteStatement() {
    sqlite3_finalize(stmt_);
}

std::unique_ptr<ResultSet> SQLiteStatement::execute_query() {
    sqlite3_reset(stmt_);
    return std::make_unique<SQLiteResultSet>(db_, stmt_);
}

SQLiteConnection::SQLiteConnection(const std::string& url, int open_flags) {
    const int code = sqlite3_open_v2(url.c_str(), &db_, open_flags, nullptr);
    if (code != SQLITE_OK) {
        SQLException error = sqlite_error(db_, "SQLite open '" + url + "' failed");
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw error;
    }
}

SQLiteConnection::~SQLiteConnection() {
    close();
}

std::unique_ptr<PreparedStatement> SQLiteConnection::prepare_statement(const std::string& sql) {
    if (!db_) {
        throw SQLException("SQLite connection is closed");
    }
    return std::make_unique<SQLiteStatement>(db_, sql);
}

void SQLiteConnection::close() noexcept {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

SQLiteDataSource::SQLiteDataSource(const DataSourceConfig& config) : config_(config) {
    if (config_.url.empty()) {
        throw std::invalid_argument("SQLite data source requires a database path");
    }
}

std::unique_ptr<DatabaseConnection> SQLiteDataSource::get_connection() {
    LogUtils::debug("Opening SQLite database {}", config_.url);
    return std::make_unique<SQLiteConnection>(config_.url, SQLITE_OPEN_READONLY | SQLITE_OPEN_URI);
}

std::string SQLiteDataSource::get_data_source_info() const {
    return "SQLite(" + config_.url + ")";
}
