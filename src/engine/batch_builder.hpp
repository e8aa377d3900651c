#pragma once

#include "parameter_binder.hpp"
#include "routine_reference.hpp"
#include "session.hpp"
#include <string>

namespace mssql_mcp::engine {

enum class InvocationStyle { Procedure, ScalarFunction, TableFunction };

const char* style_to_string(InvocationStyle style);

// Reserved marker carrying a procedure's integer return code
constexpr const char* kReturnValueName = "@RETURN_VALUE";

// {? = call [schema].[name](?, ?)}
std::string render_procedure_call(const RoutineReference& routine, const BatchPlan& plan);

// DECLARE @v0 T; SET @v0 = ?; SELECT [schema].[name](@v0) AS Result
std::string render_scalar_call(const RoutineReference& routine, const BatchPlan& plan);

// DECLARE @v0 T; SET @v0 = ?; SELECT * FROM [schema].[name](@v0)
std::string render_table_call(const RoutineReference& routine, const BatchPlan& plan);

// Statement text plus its parameters in marker order. The procedure style
// puts the return-value parameter first.
BoundStatement build_statement(const RoutineReference& routine, InvocationStyle style,
                               const BatchPlan& plan);

} // namespace mssql_mcp::engine
