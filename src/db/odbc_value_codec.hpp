#pragma once

#include "core/odbc_statement.hpp"
#include "engine/session.hpp"
#include <vector>

namespace mssql_mcp::db {

// SQL Server TIME column type reported by SQLDescribeCol (SQL_SS_TIME2)
constexpr SQLSMALLINT kSsTime2 = -154;

// Storage that SQLBindParameter points into. The statement keeps the
// addresses of `storage` and `indicator`, so a buffer must not move between
// binding and the end of execution.
struct ParameterBuffer {
    SQLSMALLINT io_type = SQL_PARAM_INPUT;
    SQLSMALLINT c_type = SQL_C_CHAR;
    SQLSMALLINT sql_type = SQL_VARCHAR;
    SQLULEN column_size = 0;
    SQLSMALLINT decimal_digits = 0;
    std::vector<unsigned char> storage;
    SQLLEN indicator = 0;
};

ParameterBuffer make_parameter_buffer(const engine::BindParameter& parameter);

// Value left in an output or input/output buffer after execution
engine::SqlValue read_parameter_value(const ParameterBuffer& buffer,
                                      const engine::BindParameter& parameter);

// Current row's cell, typed after the column's SQL type
engine::SqlValue read_column(core::OdbcStatement& stmt, SQLUSMALLINT column,
                             const core::ColumnDescription& description);

// Catalog type of a routine parameter as a declarable type
engine::SqlTypeDescriptor describe_odbc_type(SQLSMALLINT data_type, SQLINTEGER column_size,
                                             SQLSMALLINT decimal_digits);

} // namespace mssql_mcp::db
