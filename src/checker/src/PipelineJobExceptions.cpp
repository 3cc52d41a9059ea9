#include "PipelineJobExceptions.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <utility>

std::string describe_exception(const std::exception_ptr& ptr) {
    if (!ptr) {
        return "unknown error";
    }
    try {
        std::rethrow_exception(ptr);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

PrepareJobWithInvalidConnectionException::PrepareJobWithInvalidConnectionException(std::exception_ptr cause)
    : PipelineJobException(fmt::format("Data source connection is invalid, reason is: {}", describe_exception(cause))),
      cause_(std::move(cause)) {}

PrepareJobWithTargetTableNotEmptyException::PrepareJobWithTargetTableNotEmptyException(const std::string& table_name)
    : PipelineJobException(fmt::format("Target table `{}` is not empty", table_name)),
      table_name_(table_name) {}

MissingRequiredPrivilegeException::MissingRequiredPrivilegeException(const std::vector<std::string>& privileges)
    : DialectCheckException(fmt::format("Missing required privileges: '{}'", fmt::join(privileges, "', '"))),
      privileges_(privileges) {}

UnexpectedVariableValueException::UnexpectedVariableValueException(const std::string& variable_name,
                                                                   const std::string& expected_value,
                                                                   const std::string& actual_value)
    : DialectCheckException(fmt::format("Variable `{}` should be `{}`, but is `{}`",
                                        variable_name, expected_value, actual_value)),
      variable_name_(variable_name),
      actual_value_(actual_value) {}

CheckPrivilegeFailedException::CheckPrivilegeFailedException(const std::exception& cause)
    : DialectCheckException(fmt::format("Check privileges failed, reason is: {}", cause.what())) {}

CheckVariableFailedException::CheckVariableFailedException(const std::exception& cause)
    : DialectCheckException(fmt::format("Check variables failed, reason is: {}", cause.what())) {}
