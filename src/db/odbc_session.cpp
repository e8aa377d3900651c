#include "odbc_session.hpp"
#include "odbc_value_codec.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "core/odbc_statement.hpp"
#include "engine/errors.hpp"
#include <algorithm>
#include <map>

namespace mssql_mcp::db {

using engine::ExecutionOutput;
using engine::ParameterDirection;
using engine::RoutineParameterInfo;

namespace {

constexpr const char* kPreferredSchema = "dbo";

// Catalog arguments are search patterns; '_' and '%' must not match
// other routines.
std::string escape_pattern(const std::string& text) {
    std::string escaped;
    for (char c : text) {
        if (c == '_' || c == '%' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

engine::RowSet read_row_set(core::OdbcStatement& stmt, SQLSMALLINT column_count) {
    engine::RowSet row_set;
    std::vector<core::ColumnDescription> descriptions;
    for (SQLUSMALLINT col = 1; col <= column_count; ++col) {
        descriptions.push_back(stmt.describe_column(col));
        row_set.columns.push_back(descriptions.back().name);
    }

    while (stmt.fetch()) {
        std::vector<engine::SqlValue> row;
        row.reserve(descriptions.size());
        for (SQLUSMALLINT col = 1; col <= column_count; ++col) {
            row.push_back(read_column(stmt, col, descriptions[col - 1]));
        }
        row_set.rows.push_back(std::move(row));
    }
    return row_set;
}

std::string get_string(core::OdbcStatement& stmt, SQLUSMALLINT column) {
    SQLCHAR buffer[256] = {0};
    SQLLEN indicator = 0;
    SQLRETURN ret = stmt.get_data(column, SQL_C_CHAR, buffer, sizeof(buffer), &indicator);
    if (ret == SQL_NO_DATA || indicator == SQL_NULL_DATA) {
        return "";
    }
    return reinterpret_cast<char*>(buffer);
}

SQLINTEGER get_integer(core::OdbcStatement& stmt, SQLUSMALLINT column) {
    SQLINTEGER value = 0;
    SQLLEN indicator = 0;
    SQLRETURN ret = stmt.get_data(column, SQL_C_SLONG, &value, sizeof(value), &indicator);
    if (ret == SQL_NO_DATA || indicator == SQL_NULL_DATA) {
        return 0;
    }
    return value;
}

ParameterDirection direction_from_column_type(SQLINTEGER column_type) {
    switch (column_type) {
        case SQL_PARAM_INPUT_OUTPUT: return ParameterDirection::InputOutput;
        case SQL_PARAM_OUTPUT: return ParameterDirection::Output;
        case SQL_RETURN_VALUE: return ParameterDirection::ReturnValue;
        default: return ParameterDirection::Input;
    }
}

} // anonymous namespace

OdbcSession::OdbcSession(core::OdbcEnvironment& env, const std::string& connection_string,
                         SQLUINTEGER login_timeout)
    : conn_(env) {
    if (login_timeout > 0) {
        conn_.set_login_timeout(login_timeout);
    }
    conn_.connect(connection_string);
}

ExecutionOutput OdbcSession::execute(const engine::BoundStatement& statement) {
    try {
        return run(statement);
    } catch (const core::OdbcError& e) {
        LOG_DEBUG(e.format_diagnostics());
        throw engine::ExecutionFailure(e.what(), e.sqlstate());
    }
}

ExecutionOutput OdbcSession::run(const engine::BoundStatement& statement) {
    core::OdbcStatement stmt(conn_);

    // Buffers are fully built before binding: the driver keeps their addresses.
    std::vector<ParameterBuffer> buffers;
    buffers.reserve(statement.parameters.size());
    for (const auto& parameter : statement.parameters) {
        buffers.push_back(make_parameter_buffer(parameter));
    }

    for (size_t i = 0; i < buffers.size(); ++i) {
        ParameterBuffer& b = buffers[i];
        SQLUSMALLINT ordinal = static_cast<SQLUSMALLINT>(i + 1);
        stmt.bind_parameter(ordinal, b.io_type, b.c_type, b.sql_type, b.column_size,
                            b.decimal_digits, b.storage.data(),
                            static_cast<SQLLEN>(b.storage.size()), &b.indicator);
        if (statement.parameters[i].named) {
            stmt.set_parameter_name(ordinal, statement.parameters[i].name);
        }
    }

    stmt.execute(statement.sql);

    ExecutionOutput output;
    do {
        SQLSMALLINT column_count = stmt.num_result_cols();
        if (column_count > 0) {
            output.row_sets.push_back(read_row_set(stmt, column_count));
        } else {
            SQLLEN count = stmt.row_count();
            if (count >= 0) {
                output.rows_affected = std::max<std::int64_t>(output.rows_affected, 0) + count;
            }
        }
    } while (stmt.more_results());

    // Output parameters are only filled in once every result is consumed
    for (size_t i = 0; i < buffers.size(); ++i) {
        const auto& parameter = statement.parameters[i];
        if (parameter.direction == ParameterDirection::Input) {
            continue;
        }
        engine::OutputValue out;
        out.name = parameter.name;
        out.direction = parameter.direction;
        out.value = read_parameter_value(buffers[i], parameter);
        output.outputs.push_back(std::move(out));
    }

    LOG_DEBUG("Batch returned " + std::to_string(output.row_sets.size()) + " row set(s), " +
              std::to_string(output.outputs.size()) + " output value(s)");
    return output;
}

std::vector<RoutineParameterInfo> OdbcSession::describe_routine_parameters(
    const engine::RoutineReference& routine) {
    try {
        return read_procedure_columns(routine);
    } catch (const core::OdbcError& e) {
        LOG_DEBUG(e.format_diagnostics());
        throw engine::ExecutionFailure(e.what(), e.sqlstate());
    }
}

std::vector<RoutineParameterInfo> OdbcSession::read_procedure_columns(
    const engine::RoutineReference& routine) {
    core::OdbcStatement stmt(conn_);

    std::string schema = routine.schema ? escape_pattern(*routine.schema) : "";
    std::string name = escape_pattern(routine.name);
    SQLRETURN ret = SQLProcedureColumns(
        stmt.get_handle(),
        nullptr, 0,
        routine.schema ? (SQLCHAR*)schema.c_str() : nullptr,
        routine.schema ? SQL_NTS : 0,
        (SQLCHAR*)name.c_str(), SQL_NTS,
        (SQLCHAR*)"%", SQL_NTS);
    core::check_odbc_result(ret, SQL_HANDLE_STMT, stmt.get_handle(), "SQLProcedureColumns");

    // schema -> parameters, in catalog order
    std::map<std::string, std::vector<RoutineParameterInfo>> by_schema;
    std::string first_schema;
    while (stmt.fetch()) {
        std::string owner = get_string(stmt, 2);
        std::string column_name = get_string(stmt, 4);
        SQLINTEGER column_type = get_integer(stmt, 5);
        SQLINTEGER data_type = get_integer(stmt, 6);
        SQLINTEGER column_size = get_integer(stmt, 8);
        SQLINTEGER decimal_digits = get_integer(stmt, 10);

        if (column_type == SQL_RESULT_COL) {
            continue;
        }

        RoutineParameterInfo info;
        info.name = column_name;
        info.direction = direction_from_column_type(column_type);
        info.type = describe_odbc_type(static_cast<SQLSMALLINT>(data_type), column_size,
                                       static_cast<SQLSMALLINT>(decimal_digits));
        if (by_schema.empty()) {
            first_schema = owner;
        }
        by_schema[owner].push_back(std::move(info));
    }

    if (by_schema.empty()) {
        return {};
    }
    auto preferred = by_schema.find(kPreferredSchema);
    if (preferred != by_schema.end()) {
        return preferred->second;
    }
    LOG_IF(by_schema.size() > 1,
           "Routine " + routine.display() + " exists in several schemas, using " + first_schema);
    return by_schema[first_schema];
}

} // namespace mssql_mcp::db
