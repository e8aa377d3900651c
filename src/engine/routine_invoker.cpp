#include "routine_invoker.hpp"
#include "core/logger.hpp"
#include "parameter_binder.hpp"
#include "parameter_decoder.hpp"
#include "result_aggregator.hpp"

namespace mssql_mcp::engine {

namespace {

constexpr const char* kDefaultFunctionSchema = "dbo";

} // anonymous namespace

RoutineInvoker::RoutineInvoker(ConnectionProvider& provider)
    : provider_(provider) {
}

std::unique_ptr<Session> RoutineInvoker::acquire(const std::optional<std::string>& database) {
    if (database && !database->empty()) {
        return provider_.acquire(*database);
    }
    return provider_.acquire();
}

OperationResult RoutineInvoker::invoke_procedure(std::string_view routine_name,
                                                 const std::optional<std::string>& parameters,
                                                 const std::optional<std::string>& database) {
    try {
        RoutineReference routine = RoutineReference::parse(routine_name);
        ParameterMap values = parameters ? decode_parameters(*parameters) : ParameterMap{};

        auto session = acquire(database);

        std::vector<RoutineParameterInfo> declared;
        if (!values.empty()) {
            declared = session->describe_routine_parameters(routine);
        }

        BatchPlan plan = bind_named_parameters(values, declared);
        BoundStatement statement = build_statement(routine, InvocationStyle::Procedure, plan);
        LOG_DEBUG("Executing procedure batch: " + statement.sql);

        ExecutionOutput output = session->execute(statement);
        return OperationResult::ok(to_json(InvocationResult(aggregate_procedure(output))));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("ExecuteStoredProcedure failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult RoutineInvoker::invoke_scalar_function(std::string_view routine_name,
                                                       const std::optional<std::string>& parameters,
                                                       const std::optional<std::string>& database) {
    return invoke_function(InvocationStyle::ScalarFunction, routine_name, parameters, database);
}

OperationResult RoutineInvoker::invoke_table_function(std::string_view routine_name,
                                                      const std::optional<std::string>& parameters,
                                                      const std::optional<std::string>& database) {
    return invoke_function(InvocationStyle::TableFunction, routine_name, parameters, database);
}

BatchPlan RoutineInvoker::plan_function_call(const std::optional<std::string>& parameters) {
    if (!parameters) {
        return BatchPlan{};
    }
    switch (classify_parameter_text(*parameters)) {
        case ParameterShape::Empty:
            return BatchPlan{};
        case ParameterShape::JsonMap:
            return bind_parameters(decode_parameters(*parameters));
        case ParameterShape::LiteralList:
            LOG_DEBUG("Using literal argument list: " + *parameters);
            return bind_literal_list(*parameters);
    }
    return BatchPlan{};
}

OperationResult RoutineInvoker::invoke_function(InvocationStyle style, std::string_view routine_name,
                                                const std::optional<std::string>& parameters,
                                                const std::optional<std::string>& database) {
    const char* operation = style == InvocationStyle::ScalarFunction
        ? "ExecuteScalarFunction" : "ExecuteTableFunction";
    try {
        RoutineReference routine = RoutineReference::parse(routine_name)
                                       .with_default_schema(kDefaultFunctionSchema);
        BatchPlan plan = plan_function_call(parameters);
        BoundStatement statement = build_statement(routine, style, plan);
        LOG_DEBUG(std::string("Executing ") + style_to_string(style) + " batch: " + statement.sql);

        auto session = acquire(database);
        ExecutionOutput output = session->execute(statement);

        if (style == InvocationStyle::ScalarFunction) {
            return OperationResult::ok(to_json(InvocationResult(aggregate_scalar(output))));
        }
        return OperationResult::ok(to_json(InvocationResult(aggregate_table(output))));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string(operation) + " failed: " + e.what());
        return OperationResult::failure(e.what());
    }
}

} // namespace mssql_mcp::engine
