#pragma once

#include "DataSource.hpp"

// Per-dialect pre-flight rules. Both checks return silently when the data
// source satisfies them and throw a DialectCheckException otherwise.
class DialectDataSourceChecker {
public:
    virtual ~DialectDataSourceChecker() = default;

    // Credentials carry the rights the pipeline needs (replication, read)
    virtual void check_privilege(DataSource& data_source) const = 0;

    // Server settings required for consistent incremental capture
    virtual void check_variable(DataSource& data_source) const = 0;
};
