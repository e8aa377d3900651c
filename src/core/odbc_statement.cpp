#include "odbc_statement.hpp"
#include "odbc_error.hpp"
#include <vector>

namespace mssql_mcp::core {

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::recycle() noexcept {
    // SQL_CLOSE succeeds even when no cursor is open, unlike SQLCloseCursor
    // which returns 24000 in that case. Bound parameters are kept: callers
    // bind before executing.
    SQLFreeStmt(handle_, SQL_CLOSE);
}

void OdbcStatement::execute(std::string_view sql) {
    recycle();
    std::vector<SQLCHAR> text(sql.begin(), sql.end());
    text.push_back(0);
    SQLRETURN ret = SQLExecDirect(handle_, text.data(), static_cast<SQLINTEGER>(sql.length()));
    if (ret == SQL_NO_DATA) {
        return;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecDirect");
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = SQLFetch(handle_);
    
    if (ret == SQL_NO_DATA) {
        return false;
    }
    
    // Allow SQL_SUCCESS_WITH_INFO (warnings)
    if (ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO) {
        return true;
    }
    
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    return false;
}

bool OdbcStatement::more_results() {
    SQLRETURN ret = SQLMoreResults(handle_);
    if (ret == SQL_NO_DATA) {
        return false;
    }
    // A failing later statement of the batch surfaces here
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLMoreResults");
    return true;
}

SQLSMALLINT OdbcStatement::num_result_cols() {
    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumResultCols(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLNumResultCols");
    return count;
}

ColumnDescription OdbcStatement::describe_column(SQLUSMALLINT column) {
    SQLCHAR name[256] = {0};
    SQLSMALLINT name_length = 0;
    ColumnDescription desc;
    
    SQLRETURN ret = SQLDescribeCol(handle_, column, name, sizeof(name), &name_length,
                                   &desc.sql_type, &desc.column_size,
                                   &desc.decimal_digits, &desc.nullable);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLDescribeCol");
    desc.name = reinterpret_cast<char*>(name);
    return desc;
}

SQLLEN OdbcStatement::row_count() {
    SQLLEN count = -1;
    SQLRETURN ret = SQLRowCount(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLRowCount");
    return count;
}

SQLRETURN OdbcStatement::get_data(SQLUSMALLINT column, SQLSMALLINT c_type,
                                  SQLPOINTER buffer, SQLLEN buffer_length, SQLLEN* indicator) {
    SQLRETURN ret = SQLGetData(handle_, column, c_type, buffer, buffer_length, indicator);
    if (ret == SQL_NO_DATA) {
        return ret;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetData");
    return ret;
}

void OdbcStatement::bind_parameter(SQLUSMALLINT ordinal, SQLSMALLINT io_type,
                                   SQLSMALLINT c_type, SQLSMALLINT sql_type,
                                   SQLULEN column_size, SQLSMALLINT decimal_digits,
                                   SQLPOINTER buffer, SQLLEN buffer_length, SQLLEN* indicator) {
    SQLRETURN ret = SQLBindParameter(handle_, ordinal, io_type, c_type, sql_type,
                                     column_size, decimal_digits,
                                     buffer, buffer_length, indicator);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLBindParameter");
}

void OdbcStatement::set_parameter_name(SQLUSMALLINT ordinal, const std::string& name) {
    SQLHDESC ipd = SQL_NULL_HDESC;
    SQLRETURN ret = SQLGetStmtAttr(handle_, SQL_ATTR_IMP_PARAM_DESC, &ipd, 0, nullptr);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetStmtAttr(IMP_PARAM_DESC)");
    
    std::vector<SQLCHAR> text(name.begin(), name.end());
    text.push_back(0);
    ret = SQLSetDescField(ipd, ordinal, SQL_DESC_NAME, text.data(), SQL_NTS);
    check_odbc_result(ret, SQL_HANDLE_DESC, ipd, "SQLSetDescField(DESC_NAME)");
    
    ret = SQLSetDescField(ipd, ordinal, SQL_DESC_UNNAMED, (SQLPOINTER)SQL_NAMED, 0);
    check_odbc_result(ret, SQL_HANDLE_DESC, ipd, "SQLSetDescField(DESC_UNNAMED)");
}

} // namespace mssql_mcp::core
