#include "tool_registry.hpp"
#include "core/logger.hpp"
#include <stdexcept>

namespace mssql_mcp::tools {

using engine::OperationResult;
using json = nlohmann::ordered_json;

namespace {

const char* const kDatabaseDescription =
    "Optional database name. If not specified, uses the default database from connection string.";

json string_property(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

json object_schema(json properties, std::vector<std::string> required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

json database_only_schema() {
    return object_schema({{"database", string_property(kDatabaseDescription)}}, {});
}

json name_schema(const std::string& name_description) {
    return object_schema({
        {"name", string_property(name_description)},
        {"database", string_property(kDatabaseDescription)}
    }, {"name"});
}

json sql_schema(const std::string& sql_description) {
    return object_schema({
        {"sql", string_property(sql_description)},
        {"database", string_property(kDatabaseDescription)}
    }, {"sql"});
}

json routine_schema(const std::string& name_description, const std::string& parameters_description) {
    return object_schema({
        {"name", string_property(name_description)},
        {"parameters", {
            {"type", json::array({"string", "object"})},
            {"description", parameters_description}
        }},
        {"database", string_property(kDatabaseDescription)}
    }, {"name"});
}

json text_result(const std::string& text, bool is_error) {
    json result;
    result["content"] = json::array({{{"type", "text"}, {"text", text}}});
    result["isError"] = is_error;
    return result;
}

} // anonymous namespace

std::string required_string(const json& arguments, const std::string& key) {
    if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_string()) {
        throw std::invalid_argument("Missing required argument '" + key + "'");
    }
    return arguments[key].get<std::string>();
}

std::optional<std::string> optional_string(const json& arguments, const std::string& key) {
    if (!arguments.is_object() || !arguments.contains(key) || arguments[key].is_null()) {
        return std::nullopt;
    }
    if (!arguments[key].is_string()) {
        throw std::invalid_argument("Argument '" + key + "' must be a string");
    }
    return arguments[key].get<std::string>();
}

std::optional<std::string> parameter_text(const json& arguments) {
    if (!arguments.is_object() || !arguments.contains("parameters")) {
        return std::nullopt;
    }
    const json& value = arguments["parameters"];
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

ToolRegistry::ToolRegistry(engine::RoutineInvoker& invoker, DatabaseTools& database_tools) {
    register_tool({
        "execute_stored_procedure",
        "Executes a stored procedure with optional parameters and returns results including "
        "output parameters and return value",
        routine_schema("Name of stored procedure (can include schema, e.g., 'dbo.MyProc')",
                       "Optional JSON object containing parameter names and values, e.g., "
                       "{\"@param1\": \"value1\", \"@param2\": 123}"),
        {"Execute Stored Procedure", false, false, false},
        [&invoker](const json& args) {
            return invoker.invoke_procedure(required_string(args, "name"), parameter_text(args),
                                            optional_string(args, "database"));
        }
    });
    register_tool({
        "execute_scalar_function",
        "Executes a scalar function and returns the result value",
        routine_schema("Name of scalar function (can include schema, e.g., 'dbo.MyFunction')",
                       "Optional JSON object of parameter values, or comma-separated SQL literals, "
                       "e.g., \"'value1', 123, '2024-01-01'\""),
        {"Execute Scalar Function", true, true, false},
        [&invoker](const json& args) {
            return invoker.invoke_scalar_function(required_string(args, "name"), parameter_text(args),
                                                  optional_string(args, "database"));
        }
    });
    register_tool({
        "execute_table_function",
        "Executes a table-valued function and returns the result set",
        routine_schema("Name of table-valued function (can include schema, e.g., 'dbo.MyTableFunction')",
                       "Optional JSON object containing parameter names and values, e.g., "
                       "{\"@StartDate\": \"2024-01-01\", \"@EndDate\": \"2024-12-31\"}, "
                       "or comma-separated SQL literals"),
        {"Execute Table Function", true, true, false},
        [&invoker](const json& args) {
            return invoker.invoke_table_function(required_string(args, "name"), parameter_text(args),
                                                 optional_string(args, "database"));
        }
    });

    register_tool({
        "list_databases",
        "Lists all online databases on the SQL Server instance.",
        object_schema(json::object(), {}),
        {"List Databases", true, true, false},
        [&database_tools](const json&) { return database_tools.list_databases(); }
    });
    register_tool({
        "describe_instance",
        "Returns SQL Server instance information including version, edition, server properties, "
        "and configuration",
        object_schema(json::object(), {}),
        {"Describe Instance", true, true, false},
        [&database_tools](const json&) { return database_tools.describe_instance(); }
    });
    register_tool({
        "describe_database",
        "Returns comprehensive metadata about a database including properties, size, file "
        "information, and object counts",
        object_schema({{"database", string_property(
            "Optional database name. If not specified, describes the default database from "
            "connection string.")}}, {}),
        {"Describe Database", true, true, false},
        [&database_tools](const json& args) {
            return database_tools.describe_database(optional_string(args, "database"));
        }
    });
    register_tool({
        "list_views",
        "Lists all views in the SQL Database.",
        database_only_schema(),
        {"List Views", true, true, false},
        [&database_tools](const json& args) {
            return database_tools.list_views(optional_string(args, "database"));
        }
    });
    register_tool({
        "list_stored_procedures",
        "Lists all stored procedures in the SQL Database.",
        database_only_schema(),
        {"List Stored Procedures", true, true, false},
        [&database_tools](const json& args) {
            return database_tools.list_stored_procedures(optional_string(args, "database"));
        }
    });
    register_tool({
        "list_functions",
        "Lists all functions in the SQL Database.",
        database_only_schema(),
        {"List Functions", true, true, false},
        [&database_tools](const json& args) {
            return database_tools.list_functions(optional_string(args, "database"));
        }
    });

    register_tool({
        "describe_stored_procedure",
        "Returns stored procedure metadata including parameters and definition",
        name_schema("Name of stored procedure"),
        {"Describe Stored Procedure", true, true, false},
        [&database_tools](const json& args) {
            return database_tools.describe_stored_procedure(required_string(args, "name"),
                                                            optional_string(args, "database"));
        }
    });
    register_tool({
        "describe_function",
        "Returns function metadata including parameters, return type, and definition",
        name_schema("Name of function"),
        {"Describe Function", true, true, false},
        [&database_tools](const json& args) {
            return database_tools.describe_function(required_string(args, "name"),
                                                    optional_string(args, "database"));
        }
    });
    register_tool({
        "describe_view",
        "Returns view schema including columns, indexes, and definition",
        name_schema("Name of view"),
        {"Describe View", true, true, false},
        [&database_tools](const json& args) {
            return database_tools.describe_view(required_string(args, "name"),
                                                optional_string(args, "database"));
        }
    });

    register_tool({
        "insert_data",
        "Inserts data into a table using an INSERT statement",
        sql_schema("SQL INSERT statement"),
        {"Insert Data", false, false, false},
        [&database_tools](const json& args) {
            return database_tools.insert_data(required_string(args, "sql"),
                                              optional_string(args, "database"));
        }
    });
    register_tool({
        "update_data",
        "Updates data in a table using an UPDATE statement",
        sql_schema("SQL UPDATE statement"),
        {"Update Data", false, false, false},
        [&database_tools](const json& args) {
            return database_tools.update_data(required_string(args, "sql"),
                                              optional_string(args, "database"));
        }
    });
    register_tool({
        "create_table",
        "Creates a new table in the SQL Database",
        sql_schema("SQL CREATE TABLE statement"),
        {"Create Table", false, false, false},
        [&database_tools](const json& args) {
            return database_tools.create_table(required_string(args, "sql"),
                                               optional_string(args, "database"));
        }
    });
    register_tool({
        "drop_table",
        "Drops a table from the SQL Database",
        name_schema("Name of table to drop"),
        {"Drop Table", false, true, true},
        [&database_tools](const json& args) {
            return database_tools.drop_table(required_string(args, "name"),
                                             optional_string(args, "database"));
        }
    });
}

void ToolRegistry::register_tool(Tool tool) {
    auto existing = index_.find(tool.name);
    if (existing != index_.end()) {
        LOG_WARN("Tool " + tool.name + " registered twice, replacing");
        tools_[existing->second] = std::move(tool);
        return;
    }
    index_[tool.name] = tools_.size();
    tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &tools_[it->second];
}

json ToolRegistry::list_tools() const {
    json tools = json::array();
    for (const auto& tool : tools_) {
        json entry;
        entry["name"] = tool.name;
        entry["description"] = tool.description;
        entry["inputSchema"] = tool.input_schema;
        entry["annotations"] = {
            {"title", tool.annotations.title},
            {"readOnlyHint", tool.annotations.read_only},
            {"idempotentHint", tool.annotations.idempotent},
            {"destructiveHint", tool.annotations.destructive}
        };
        tools.push_back(std::move(entry));
    }
    LOG_DEBUG("Listing " + std::to_string(tools.size()) + " tools");

    json result;
    result["tools"] = std::move(tools);
    return result;
}

json ToolRegistry::call_tool(const std::string& name, const json& arguments) const {
    const Tool* tool = find(name);
    if (!tool) {
        std::string available = "Available tools: ";
        for (size_t i = 0; i < tools_.size(); ++i) {
            if (i > 0) available += ", ";
            available += tools_[i].name;
        }
        LOG_WARN("Unknown tool requested: " + name);
        return text_result("Unknown tool: " + name + ". " + available, true);
    }

    LOG_INFO("Tool call: " + name);
    OperationResult result = [&]() {
        try {
            return tool->handler(arguments);
        } catch (const std::exception& e) {
            LOG_ERROR(name + " failed: " + e.what());
            return OperationResult::failure(e.what());
        }
    }();
    return text_result(result.to_json().dump(), !result.success());
}

} // namespace mssql_mcp::tools
