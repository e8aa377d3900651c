#pragma once

#include "tools/tool_registry.hpp"
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mssql_mcp::server {

constexpr const char* kProtocolVersion = "2024-11-05";

// MCP over newline-delimited JSON-RPC 2.0. Requests are handled one at a
// time in arrival order.
class McpServer {
public:
    McpServer(const tools::ToolRegistry& registry, std::string name, std::string version);

    // Response for one message line; std::nullopt for notifications
    std::optional<nlohmann::ordered_json> handle_message(const std::string& line);

    // Serves `in` until end of input, one response line per request
    void run(std::istream& in, std::ostream& out);

private:
    nlohmann::ordered_json dispatch(const std::string& method, const nlohmann::ordered_json& params);
    nlohmann::ordered_json handle_initialize(const nlohmann::ordered_json& params);
    nlohmann::ordered_json handle_tool_call(const nlohmann::ordered_json& params);

    const tools::ToolRegistry& registry_;
    std::string name_;
    std::string version_;
};

} // namespace mssql_mcp::server
