#pragma once

#include "database_tools.hpp"
#include "engine/routine_invoker.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mssql_mcp::tools {

// MCP tool hints
struct ToolAnnotations {
    std::string title;
    bool read_only = false;
    bool idempotent = false;
    bool destructive = false;
};

using ToolHandler = std::function<engine::OperationResult(const nlohmann::ordered_json& arguments)>;

struct Tool {
    std::string name;
    std::string description;
    nlohmann::ordered_json input_schema;
    ToolAnnotations annotations;
    ToolHandler handler;
};

// Argument readers for handlers. A missing or non-string required argument
// throws std::invalid_argument naming it.
std::string required_string(const nlohmann::ordered_json& arguments, const std::string& key);
std::optional<std::string> optional_string(const nlohmann::ordered_json& arguments, const std::string& key);
// `parameters` as raw text: strings pass through, objects are serialized
std::optional<std::string> parameter_text(const nlohmann::ordered_json& arguments);

class ToolRegistry {
public:
    ToolRegistry() = default;
    // Registers every routine and database tool against the given backends
    ToolRegistry(engine::RoutineInvoker& invoker, DatabaseTools& database_tools);

    void register_tool(Tool tool);

    const Tool* find(const std::string& name) const;
    size_t size() const noexcept { return tools_.size(); }

    // {"tools": [{name, description, inputSchema, annotations}, ...]}
    nlohmann::ordered_json list_tools() const;

    // MCP CallToolResult: content[0].text holds the envelope JSON, isError
    // mirrors !success. Unknown tools list the available names.
    nlohmann::ordered_json call_tool(const std::string& name, const nlohmann::ordered_json& arguments) const;

private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mssql_mcp::tools
