#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

// Base of every failure raised while preparing a pipeline job
class PipelineJobException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A connection could not be acquired or used. The original failure is kept in cause().
class PrepareJobWithInvalidConnectionException : public PipelineJobException {
public:
    explicit PrepareJobWithInvalidConnectionException(std::exception_ptr cause);

    std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

class PrepareJobWithTargetTableNotEmptyException : public PipelineJobException {
public:
    explicit PrepareJobWithTargetTableNotEmptyException(const std::string& table_name);

    const std::string& table_name() const noexcept { return table_name_; }

private:
    std::string table_name_;
};

// Raised by dialect checkers; the engine passes these through unchanged
class DialectCheckException : public PipelineJobException {
public:
    using PipelineJobException::PipelineJobException;
};

class MissingRequiredPrivilegeException : public DialectCheckException {
public:
    explicit MissingRequiredPrivilegeException(const std::vector<std::string>& privileges);

    const std::vector<std::string>& privileges() const noexcept { return privileges_; }

private:
    std::vector<std::string> privileges_;
};

class UnexpectedVariableValueException : public DialectCheckException {
public:
    UnexpectedVariableValueException(const std::string& variable_name,
                                     const std::string& expected_value,
                                     const std::string& actual_value);

    const std::string& variable_name() const noexcept { return variable_name_; }
    const std::string& actual_value() const noexcept { return actual_value_; }

private:
    std::string variable_name_;
    std::string actual_value_;
};

class CheckPrivilegeFailedException : public DialectCheckException {
public:
    explicit CheckPrivilegeFailedException(const std::exception& cause);
};

class CheckVariableFailedException : public DialectCheckException {
public:
    explicit CheckVariableFailedException(const std::exception& cause);
};

// Message of the exception held by ptr, or "unknown error"
std::string describe_exception(const std::exception_ptr& ptr);
