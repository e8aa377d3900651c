#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace mssql_mcp::core {

// RAII wrapper for ODBC Environment handle (ODBC 3.80 behaviour)
class OdbcEnvironment {
public:
    // When pooling is true, driver-manager connection pooling (one pool per
    // driver) is switched on for the process before the handle is allocated,
    // and SQLDisconnect returns connections to the pool instead of closing them.
    explicit OdbcEnvironment(bool pooling = false);
    ~OdbcEnvironment();
    
    // Non-copyable
    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;
    
    // Movable
    OdbcEnvironment(OdbcEnvironment&& other) noexcept;
    OdbcEnvironment& operator=(OdbcEnvironment&& other) noexcept;
    
    SQLHENV get_handle() const noexcept { return handle_; }
    bool pooling_enabled() const noexcept { return pooling_; }
    
private:
    void release() noexcept;

    SQLHENV handle_ = SQL_NULL_HENV;
    bool pooling_ = false;
};

} // namespace mssql_mcp::core
