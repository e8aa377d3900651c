#pragma once

#include "batch_builder.hpp"
#include "operation_result.hpp"
#include "session.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mssql_mcp::engine {

// Runs stored routines with caller-supplied parameters. Each call acquires
// its own session and never throws: failures come back as a failed
// OperationResult and are logged.
class RoutineInvoker {
public:
    explicit RoutineInvoker(ConnectionProvider& provider);

    // parameters: JSON object text, named after the procedure's parameters
    OperationResult invoke_procedure(std::string_view routine_name,
                                     const std::optional<std::string>& parameters = std::nullopt,
                                     const std::optional<std::string>& database = std::nullopt);

    // parameters: JSON object text, or a comma-separated SQL literal list
    OperationResult invoke_scalar_function(std::string_view routine_name,
                                           const std::optional<std::string>& parameters = std::nullopt,
                                           const std::optional<std::string>& database = std::nullopt);

    OperationResult invoke_table_function(std::string_view routine_name,
                                          const std::optional<std::string>& parameters = std::nullopt,
                                          const std::optional<std::string>& database = std::nullopt);

private:
    std::unique_ptr<Session> acquire(const std::optional<std::string>& database);
    // JSON map or literal list, decided by the shape of the text
    BatchPlan plan_function_call(const std::optional<std::string>& parameters);
    OperationResult invoke_function(InvocationStyle style, std::string_view routine_name,
                                    const std::optional<std::string>& parameters,
                                    const std::optional<std::string>& database);

    ConnectionProvider& provider_;
};

} // namespace mssql_mcp::engine
