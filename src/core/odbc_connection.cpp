#include "odbc_connection.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"
#include <vector>
#include <cstdint>

namespace mssql_mcp::core {

OdbcConnection::OdbcConnection(OdbcEnvironment& env)
    : env_(env) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, env_.get_handle(), "SQLAllocHandle(DBC)");
}

OdbcConnection::~OdbcConnection() {
    if (connected_) {
        // No throwing from here: a failed disconnect still frees the handle.
        SQLRETURN ret = SQLDisconnect(handle_);
        if (!SQL_SUCCEEDED(ret)) {
            LOG_WARN("SQLDisconnect failed while releasing connection");
        }
    }
    
    if (handle_ != SQL_NULL_HDBC) {
        SQLFreeHandle(SQL_HANDLE_DBC, handle_);
    }
}

void OdbcConnection::set_login_timeout(SQLUINTEGER seconds) {
    SQLRETURN ret = SQLSetConnectAttr(handle_, SQL_ATTR_LOGIN_TIMEOUT,
                                      (SQLPOINTER)(uintptr_t)seconds, SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLSetConnectAttr(LOGIN_TIMEOUT)");
}

void OdbcConnection::connect(std::string_view connection_string) {
    if (connected_) {
        throw OdbcError("Already connected");
    }
    
    // SQLDriverConnect wants a mutable buffer
    std::vector<SQLCHAR> in_conn_str(connection_string.begin(), connection_string.end());
    in_conn_str.push_back(0);

    SQLCHAR out_conn_str[1024];
    SQLSMALLINT out_conn_str_len;
    
    SQLRETURN ret = SQLDriverConnect(
        handle_,
        nullptr,  // No window handle
        in_conn_str.data(),
        static_cast<SQLSMALLINT>(connection_string.length()),
        out_conn_str,
        sizeof(out_conn_str),
        &out_conn_str_len,
        SQL_DRIVER_NOPROMPT
    );
    
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    connected_ = true;
}

void OdbcConnection::disconnect() {
    if (!connected_) {
        return;
    }
    
    SQLRETURN ret = SQLDisconnect(handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDisconnect");
    connected_ = false;
}

} // namespace mssql_mcp::core
