#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Raised by data source drivers when opening a connection or running a statement fails
class SQLException : public std::runtime_error {
public:
    explicit SQLException(const std::string& message, int error_code = 0, std::string sql_state = "")
        : std::runtime_error(message), error_code_(error_code), sql_state_(std::move(sql_state)) {}

    int error_code() const noexcept { return error_code_; }
    const std::string& sql_state() const noexcept { return sql_state_; }

private:
    int error_code_;
    std::string sql_state_;
};
