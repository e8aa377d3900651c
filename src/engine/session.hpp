#pragma once

#include "routine_reference.hpp"
#include "sql_value.hpp"
#include "type_inference.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mssql_mcp::engine {

enum class ParameterDirection { Input, InputOutput, Output, ReturnValue };

// One '?' marker of a statement. `name` is the logical bind name; it is
// sent to the driver only when `named` is set.
struct BindParameter {
    std::string name;
    SqlValue value;
    ParameterDirection direction = ParameterDirection::Input;
    std::optional<SqlTypeDescriptor> declared_type;
    bool named = false;
};

struct BoundStatement {
    std::string sql;
    std::vector<BindParameter> parameters;  // marker order
};

struct RowSet {
    std::vector<std::string> columns;
    std::vector<std::vector<SqlValue>> rows;
};

struct OutputValue {
    std::string name;
    ParameterDirection direction = ParameterDirection::Output;
    SqlValue value;
};

struct ExecutionOutput {
    std::vector<RowSet> row_sets;     // every result that had columns, in order
    std::vector<OutputValue> outputs; // non-input parameters, in marker order
    std::int64_t rows_affected = -1;  // sum of reported row counts, -1 if none
};

// A parameter as the routine declares it in the catalog
struct RoutineParameterInfo {
    std::string name;  // with the leading '@'
    ParameterDirection direction = ParameterDirection::Input;
    SqlTypeDescriptor type;
};

// One open connection, exclusively owned by a single invocation.
class Session {
public:
    virtual ~Session() = default;

    // Submits the batch and drains all of its results. Throws on failure.
    virtual ExecutionOutput execute(const BoundStatement& statement) = 0;

    virtual std::vector<RoutineParameterInfo> describe_routine_parameters(
        const RoutineReference& routine) = 0;
};

// Hands out open sessions; a session releases its connection when destroyed.
class ConnectionProvider {
public:
    virtual ~ConnectionProvider() = default;

    virtual std::unique_ptr<Session> acquire() = 0;
    virtual std::unique_ptr<Session> acquire(const std::string& database) = 0;
};

} // namespace mssql_mcp::engine
