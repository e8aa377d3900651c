#include <cstdlib>
#include <iostream>
#include <CLI/CLI.hpp>
#include "mssql_mcp/version.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "db/odbc_connection_provider.hpp"
#include "engine/routine_invoker.hpp"
#include "server/mcp_server.hpp"
#include "tools/database_tools.hpp"
#include "tools/tool_registry.hpp"

using namespace mssql_mcp;

namespace {

// Positional argument first, then MSSQL_CONNECTION_STRING, then CONNECTION_STRING
std::string resolve_connection_string(const std::string& from_args) {
    if (!from_args.empty()) {
        return from_args;
    }
    for (const char* name : {"MSSQL_CONNECTION_STRING", "CONNECTION_STRING"}) {
        const char* value = std::getenv(name);
        if (value && *value) {
            LOG_DEBUG(std::string("Using connection string from ") + name);
            return value;
        }
    }
    return "";
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "mssql-mcp - SQL Server tools over the Model Context Protocol\n"
        "\n"
        "  Serves MCP (JSON-RPC 2.0) on stdin/stdout: schema listing and\n"
        "  description, data modification, and stored procedure / function\n"
        "  invocation with typed, bound parameters.\n"
        "\n"
        "Examples:\n"
        "  mssql-mcp \"Driver={ODBC Driver 18 for SQL Server};Server=localhost;Database=Sales;...\"\n"
        "  MSSQL_CONNECTION_STRING=\"DSN=Sales\" mssql-mcp --log-level debug --log-file mcp.log\n",
        "mssql-mcp"
    };

    app.set_version_flag("--version,-V", MSSQL_MCP_VERSION);

    std::string connection_arg;
    app.add_option("connection", connection_arg,
                   "ODBC connection string (default: $MSSQL_CONNECTION_STRING, then $CONNECTION_STRING)");

    std::string log_level = "info";
    app.add_option("--log-level", log_level, "Minimum log level written to stderr")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"}, CLI::ignore_case))
        ->capture_default_str();

    std::string log_file;
    app.add_option("--log-file", log_file, "Also append log lines to FILE");

    db::ConnectionOptions options;
    app.add_flag("--pooling", options.pooling, "Enable ODBC driver-manager connection pooling");
    app.add_option("--login-timeout", options.login_timeout, "Login timeout in seconds (0 = driver default)")
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    auto& logger = core::Logger::instance();
    logger.set_level(core::parse_log_level(log_level).value_or(core::LogLevel::INFO));
    if (!log_file.empty()) {
        logger.set_output(log_file);
    }

    std::string connection_string = resolve_connection_string(connection_arg);
    if (connection_string.empty()) {
        std::cerr << "No connection string: pass one as an argument or set MSSQL_CONNECTION_STRING\n";
        return 2;
    }

    try {
        db::OdbcConnectionProvider provider(connection_string, options);
        engine::RoutineInvoker invoker(provider);
        tools::DatabaseTools database_tools(provider);
        tools::ToolRegistry registry(invoker, database_tools);

        LOG_INFO("mssql-mcp " MSSQL_MCP_VERSION " ready, " + std::to_string(registry.size()) + " tools");
        server::McpServer server(registry, "mssql-mcp", MSSQL_MCP_VERSION);
        server.run(std::cin, std::cout);
        return 0;
    } catch (const core::OdbcError& e) {
        std::cerr << "ODBC Error: " << e.what() << "\n";
        std::cerr << e.format_diagnostics() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
}
