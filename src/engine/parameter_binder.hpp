#pragma once

#include "parameter_decoder.hpp"
#include "session.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace mssql_mcp::engine {

struct VariableDeclaration {
    std::string variable;
    SqlTypeDescriptor type;
};

struct VariableAssignment {
    std::string variable;
    std::string bind_parameter;
};

// declarations[i] and assignments[i] always name the same variable.
struct BatchPlan {
    std::vector<VariableDeclaration> declarations;
    std::vector<VariableAssignment> assignments;
    std::vector<BindParameter> bind_parameters;
    std::vector<std::string> arguments;  // expressions passed to the routine
};

// Declare/assign binding: entry i is bound as @p{i} and passed as @v{i}.
BatchPlan bind_parameters(const ParameterMap& parameters);

// Direct binding by routine parameter name ('@' added when missing).
// Parameters the routine declares as output come back as InputOutput binds
// typed after the declaration.
BatchPlan bind_named_parameters(const ParameterMap& parameters,
                                const std::vector<RoutineParameterInfo>& declared);

// Caller-supplied SQL literals, passed through as the single argument text.
BatchPlan bind_literal_list(std::string_view literals);

} // namespace mssql_mcp::engine
