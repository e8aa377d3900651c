#pragma once

#include "core/odbc_environment.hpp"
#include "engine/session.hpp"
#include <memory>
#include <string>

namespace mssql_mcp::db {

struct ConnectionOptions {
    bool pooling = false;           // driver-manager connection pooling
    SQLUINTEGER login_timeout = 0;  // seconds, 0 = driver default
};

// Opens a fresh OdbcSession per acquire from one shared environment.
class OdbcConnectionProvider : public engine::ConnectionProvider {
public:
    OdbcConnectionProvider(std::string connection_string, ConnectionOptions options = {});

    std::unique_ptr<engine::Session> acquire() override;
    std::unique_ptr<engine::Session> acquire(const std::string& database) override;

    // Connection string with its Database / Initial Catalog key replaced by
    // Database=<database> (appended when absent). Values are brace-quoted
    // when they contain ';', '{' or '}'.
    static std::string with_database(const std::string& connection_string,
                                     const std::string& database);

private:
    std::unique_ptr<engine::Session> open(const std::string& connection_string);

    std::string connection_string_;
    ConnectionOptions options_;
    core::OdbcEnvironment env_;
};

} // namespace mssql_mcp::db
