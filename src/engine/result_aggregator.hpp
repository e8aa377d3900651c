#pragma once

#include "session.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mssql_mcp::engine {

using NamedValues = std::vector<std::pair<std::string, SqlValue>>;

// Row sets kept after dropping the empty ones: none, exactly one
// (result_set) or several (result_sets).
using ProcedureRowSets = std::variant<std::monostate, RowSet, std::vector<RowSet>>;

struct ProcedureResult {
    ProcedureRowSets row_sets;
    SqlValue return_value;
    // Present only when the call produced more than the return code
    std::optional<NamedValues> output_parameters;
};

struct ScalarResult {
    SqlValue value;
};

struct TableResult {
    RowSet rows;
};

using InvocationResult = std::variant<ProcedureResult, ScalarResult, TableResult>;

ProcedureResult aggregate_procedure(const ExecutionOutput& output);
ScalarResult aggregate_scalar(const ExecutionOutput& output);
TableResult aggregate_table(const ExecutionOutput& output);

// List of row objects keyed by column name
nlohmann::ordered_json rows_to_json(const RowSet& row_set);

// Procedure: {result_set|result_sets?, output_parameters?, return_value}
// Scalar:    {result}
// Table:     [row, ...]
nlohmann::ordered_json to_json(const InvocationResult& result);

} // namespace mssql_mcp::engine
