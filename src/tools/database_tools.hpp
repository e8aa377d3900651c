#pragma once

#include "engine/operation_result.hpp"
#include "engine/session.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mssql_mcp::tools {

// Fixed-SQL catalog, describe and data-modification operations. Like the
// routine invoker, each call uses its own session and never throws.
class DatabaseTools {
public:
    explicit DatabaseTools(engine::ConnectionProvider& provider);

    // Always runs against the connection string's default database
    engine::OperationResult list_databases();

    // Version, configuration, resources and database counts of the server
    engine::OperationResult describe_instance();
    // Properties, size, files, object counts and schemas of one database
    engine::OperationResult describe_database(const std::optional<std::string>& database = std::nullopt);

    // "schema.name" strings
    engine::OperationResult list_views(const std::optional<std::string>& database = std::nullopt);
    engine::OperationResult list_stored_procedures(const std::optional<std::string>& database = std::nullopt);
    engine::OperationResult list_functions(const std::optional<std::string>& database = std::nullopt);

    engine::OperationResult describe_stored_procedure(const std::string& name,
                                                      const std::optional<std::string>& database = std::nullopt);
    engine::OperationResult describe_function(const std::string& name,
                                              const std::optional<std::string>& database = std::nullopt);
    engine::OperationResult describe_view(const std::string& name,
                                          const std::optional<std::string>& database = std::nullopt);

    engine::OperationResult insert_data(const std::string& sql,
                                        const std::optional<std::string>& database = std::nullopt);
    engine::OperationResult update_data(const std::string& sql,
                                        const std::optional<std::string>& database = std::nullopt);
    engine::OperationResult create_table(const std::string& sql,
                                         const std::optional<std::string>& database = std::nullopt);
    engine::OperationResult drop_table(const std::string& name,
                                       const std::optional<std::string>& database = std::nullopt);

private:
    std::unique_ptr<engine::Session> acquire(const std::optional<std::string>& database);
    engine::OperationResult list_qualified_names(const char* operation, const char* query,
                                                 const std::optional<std::string>& database);
    engine::OperationResult execute_write(const char* operation, const std::string& sql,
                                          const std::optional<std::string>& database,
                                          bool report_rows);
    // Runs a describe batch with @Name / @Schema bound from the object name
    engine::ExecutionOutput run_describe(const engine::RoutineReference& object, const std::string& batch,
                                         const std::optional<std::string>& database);

    engine::ConnectionProvider& provider_;
};

} // namespace mssql_mcp::tools
