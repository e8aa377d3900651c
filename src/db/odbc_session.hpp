#pragma once

#include "core/odbc_connection.hpp"
#include "engine/session.hpp"
#include <string>

namespace mssql_mcp::db {

// Session over one ODBC connection, opened on construction and closed (or
// returned to the driver manager's pool) on destruction.
class OdbcSession : public engine::Session {
public:
    OdbcSession(core::OdbcEnvironment& env, const std::string& connection_string,
                SQLUINTEGER login_timeout = 0);

    OdbcSession(const OdbcSession&) = delete;
    OdbcSession& operator=(const OdbcSession&) = delete;

    engine::ExecutionOutput execute(const engine::BoundStatement& statement) override;

    // SQLProcedureColumns; routines without a schema prefer the dbo entry
    std::vector<engine::RoutineParameterInfo> describe_routine_parameters(
        const engine::RoutineReference& routine) override;

private:
    engine::ExecutionOutput run(const engine::BoundStatement& statement);
    std::vector<engine::RoutineParameterInfo> read_procedure_columns(
        const engine::RoutineReference& routine);

    core::OdbcConnection conn_;
};

} // namespace mssql_mcp::db
