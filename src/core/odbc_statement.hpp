#pragma once

#include "odbc_connection.hpp"
#include <string>
#include <string_view>

namespace mssql_mcp::core {

// Result column metadata from SQLDescribeCol
struct ColumnDescription {
    std::string name;
    SQLSMALLINT sql_type = SQL_UNKNOWN_TYPE;
    SQLULEN column_size = 0;
    SQLSMALLINT decimal_digits = 0;
    SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;
};

// RAII wrapper for ODBC Statement handle
class OdbcStatement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement();
    
    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;
    
    // Executes with the parameters currently bound. SQL_NO_DATA (a searched
    // UPDATE/DELETE that touched nothing) counts as success.
    void execute(std::string_view sql);
    
    bool fetch();
    // Advances to the next result of a batch; false once all are consumed.
    bool more_results();
    
    SQLSMALLINT num_result_cols();
    ColumnDescription describe_column(SQLUSMALLINT column);
    SQLLEN row_count();
    
    // Raw SQLGetData; throws on error, returns SQL_SUCCESS, SQL_SUCCESS_WITH_INFO
    // (truncated, more data pending) or SQL_NO_DATA (all data already read).
    SQLRETURN get_data(SQLUSMALLINT column, SQLSMALLINT c_type,
                       SQLPOINTER buffer, SQLLEN buffer_length, SQLLEN* indicator);
    
    void bind_parameter(SQLUSMALLINT ordinal, SQLSMALLINT io_type,
                        SQLSMALLINT c_type, SQLSMALLINT sql_type,
                        SQLULEN column_size, SQLSMALLINT decimal_digits,
                        SQLPOINTER buffer, SQLLEN buffer_length, SQLLEN* indicator);
    // Names a bound parameter in the implementation parameter descriptor so the
    // driver matches it to the routine parameter of that name.
    void set_parameter_name(SQLUSMALLINT ordinal, const std::string& name);
    
    SQLHSTMT get_handle() const noexcept { return handle_; }
    
private:
    void recycle() noexcept;

    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
};

} // namespace mssql_mcp::core
