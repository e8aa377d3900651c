#include "mcp_server.hpp"
#include "core/logger.hpp"
#include <istream>
#include <ostream>
#include <stdexcept>

namespace mssql_mcp::server {

using json = nlohmann::ordered_json;

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

class JsonRpcError : public std::runtime_error {
public:
    JsonRpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    int code() const noexcept { return code_; }

private:
    int code_;
};

json error_response(const json& id, int code, const std::string& message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"] = {{"code", code}, {"message", message}};
    return response;
}

} // anonymous namespace

McpServer::McpServer(const tools::ToolRegistry& registry, std::string name, std::string version)
    : registry_(registry), name_(std::move(name)), version_(std::move(version)) {
}

std::optional<json> McpServer::handle_message(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        LOG_WARN(std::string("Unparsable message: ") + e.what());
        return error_response(nullptr, kParseError, std::string("Parse error: ") + e.what());
    }

    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        json id = message.is_object() && message.contains("id") ? message["id"] : json(nullptr);
        return error_response(id, kInvalidRequest, "Invalid Request");
    }

    std::string method = message["method"].get<std::string>();
    bool is_notification = !message.contains("id");
    json id = is_notification ? json(nullptr) : message["id"];
    json params = message.value("params", json::object());

    if (is_notification) {
        LOG_DEBUG("Notification: " + method);
        return std::nullopt;
    }

    LOG_DEBUG("Request: method=" + method);
    try {
        json response;
        response["jsonrpc"] = "2.0";
        response["id"] = id;
        response["result"] = dispatch(method, params);
        return response;
    } catch (const JsonRpcError& e) {
        LOG_WARN(method + ": " + e.what());
        return error_response(id, e.code(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(method + " failed: " + e.what());
        return error_response(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

void McpServer::run(std::istream& in, std::ostream& out) {
    LOG_INFO("Serving MCP on stdio");
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto response = handle_message(line);
        if (response) {
            out << response->dump() << "\n";
            out.flush();
        }
    }
    LOG_INFO("Input closed, shutting down");
}

json McpServer::dispatch(const std::string& method, const json& params) {
    if (method == "initialize") {
        return handle_initialize(params);
    }
    if (method == "ping") {
        return json::object();
    }
    if (method == "tools/list") {
        return registry_.list_tools();
    }
    if (method == "tools/call") {
        return handle_tool_call(params);
    }
    throw JsonRpcError(kMethodNotFound, "Method not found: " + method);
}

json McpServer::handle_initialize(const json& params) {
    if (params.is_object() && params.contains("clientInfo")) {
        LOG_INFO("Client: " + params["clientInfo"].value("name", std::string("unknown")));
    }

    json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {{"tools", {{"listChanged", false}}}};
    result["serverInfo"] = {{"name", name_}, {"version", version_}};
    return result;
}

json McpServer::handle_tool_call(const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw JsonRpcError(kInvalidParams, "Missing required parameter: name");
    }
    json arguments = params.value("arguments", json::object());
    if (!arguments.is_object()) {
        throw JsonRpcError(kInvalidParams, "Invalid arguments parameter: expected an object");
    }
    return registry_.call_tool(params["name"].get<std::string>(), arguments);
}

} // namespace mssql_mcp::server
