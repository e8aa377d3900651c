#include "odbc_environment.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace mssql_mcp::core {

OdbcEnvironment::OdbcEnvironment(bool pooling)
    : pooling_(pooling) {
    SQLRETURN ret;
    if (pooling_) {
        // Process-level attribute: must be set on the null handle before any
        // environment exists.
        ret = SQLSetEnvAttr(SQL_NULL_HENV, SQL_ATTR_CONNECTION_POOLING,
                            (SQLPOINTER)SQL_CP_ONE_PER_DRIVER, SQL_IS_UINTEGER);
        check_odbc_result(ret, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "SQLSetEnvAttr(CONNECTION_POOLING)");
    }

    ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "SQLAllocHandle(ENV)");
    
    // Call escapes with named parameters need 3.x behaviour; 3.80 when the
    // driver manager supports it.
    ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3_80, 0);
    if (!SQL_SUCCEEDED(ret)) {
        LOG_DEBUG("SQL_OV_ODBC3_80 rejected, falling back to SQL_OV_ODBC3");
        ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
    }
    if (!SQL_SUCCEEDED(ret)) {
        OdbcError error = OdbcError::from_handle(SQL_HANDLE_ENV, handle_, "SQLSetEnvAttr(ODBC_VERSION)");
        release();
        throw error;
    }

    if (pooling_) {
        ret = SQLSetEnvAttr(handle_, SQL_ATTR_CP_MATCH, (SQLPOINTER)SQL_CP_RELAXED_MATCH, SQL_IS_UINTEGER);
        LOG_IF(!SQL_SUCCEEDED(ret), "SQL_ATTR_CP_MATCH not supported, using strict matching");
    }
}

OdbcEnvironment::~OdbcEnvironment() {
    release();
}

void OdbcEnvironment::release() noexcept {
    if (handle_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        handle_ = SQL_NULL_HENV;
    }
}

OdbcEnvironment::OdbcEnvironment(OdbcEnvironment&& other) noexcept
    : handle_(other.handle_), pooling_(other.pooling_) {
    other.handle_ = SQL_NULL_HENV;
}

OdbcEnvironment& OdbcEnvironment::operator=(OdbcEnvironment&& other) noexcept {
    if (this != &other) {
        release();
        handle_ = other.handle_;
        pooling_ = other.pooling_;
        other.handle_ = SQL_NULL_HENV;
    }
    return *this;
}

} // namespace mssql_mcp::core
