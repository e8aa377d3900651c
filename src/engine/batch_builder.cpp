#include "batch_builder.hpp"

namespace mssql_mcp::engine {

namespace {

std::string join_arguments(const std::vector<std::string>& arguments) {
    std::string joined;
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += arguments[i];
    }
    return joined;
}

// "DECLARE @v0 INT; DECLARE @v1 BIT; SET @v0 = ?; SET @v1 = ?; "
std::string render_preamble(const BatchPlan& plan) {
    std::string preamble;
    for (const auto& declaration : plan.declarations) {
        preamble += "DECLARE " + declaration.variable + " " + declaration.type.declaration() + "; ";
    }
    for (const auto& assignment : plan.assignments) {
        preamble += "SET " + assignment.variable + " = ?; ";
    }
    return preamble;
}

} // anonymous namespace

const char* style_to_string(InvocationStyle style) {
    switch (style) {
        case InvocationStyle::Procedure: return "procedure";
        case InvocationStyle::ScalarFunction: return "scalar function";
        case InvocationStyle::TableFunction: return "table function";
        default: return "unknown";
    }
}

std::string render_procedure_call(const RoutineReference& routine, const BatchPlan& plan) {
    return "{? = call " + routine.quoted() + "(" + join_arguments(plan.arguments) + ")}";
}

std::string render_scalar_call(const RoutineReference& routine, const BatchPlan& plan) {
    return render_preamble(plan) + "SELECT " + routine.quoted() + "(" +
           join_arguments(plan.arguments) + ") AS Result";
}

std::string render_table_call(const RoutineReference& routine, const BatchPlan& plan) {
    return render_preamble(plan) + "SELECT * FROM " + routine.quoted() + "(" +
           join_arguments(plan.arguments) + ")";
}

BoundStatement build_statement(const RoutineReference& routine, InvocationStyle style,
                               const BatchPlan& plan) {
    BoundStatement statement;
    switch (style) {
        case InvocationStyle::Procedure: {
            statement.sql = render_procedure_call(routine, plan);
            BindParameter return_value;
            return_value.name = kReturnValueName;
            return_value.direction = ParameterDirection::ReturnValue;
            return_value.declared_type = SqlTypeDescriptor::of(SqlTypeTag::Int);
            statement.parameters.push_back(std::move(return_value));
            break;
        }
        case InvocationStyle::ScalarFunction:
            statement.sql = render_scalar_call(routine, plan);
            break;
        case InvocationStyle::TableFunction:
            statement.sql = render_table_call(routine, plan);
            break;
    }
    statement.parameters.insert(statement.parameters.end(),
                                plan.bind_parameters.begin(), plan.bind_parameters.end());
    return statement;
}

} // namespace mssql_mcp::engine
