#include "database_tools.hpp"
#include "core/logger.hpp"
#include "engine/errors.hpp"
#include "engine/result_aggregator.hpp"
#include <algorithm>

namespace mssql_mcp::tools {

using engine::BoundStatement;
using engine::ExecutionOutput;
using engine::OperationResult;
using engine::RoutineReference;
using engine::SqlValue;

namespace {

const char* const kListDatabasesQuery =
    "SELECT name, database_id, create_date, state_desc AS state, "
    "recovery_model_desc AS recovery_model, compatibility_level "
    "FROM sys.databases WHERE state_desc = 'ONLINE' ORDER BY name";

const char* const kListViewsQuery =
    "SELECT TABLE_SCHEMA, TABLE_NAME FROM INFORMATION_SCHEMA.VIEWS "
    "ORDER BY TABLE_SCHEMA, TABLE_NAME";

const char* const kListProceduresQuery =
    "SELECT ROUTINE_SCHEMA, ROUTINE_NAME FROM INFORMATION_SCHEMA.ROUTINES "
    "WHERE ROUTINE_TYPE = 'PROCEDURE' ORDER BY ROUTINE_SCHEMA, ROUTINE_NAME";

const char* const kListFunctionsQuery =
    "SELECT ROUTINE_SCHEMA, ROUTINE_NAME FROM INFORMATION_SCHEMA.ROUTINES "
    "WHERE ROUTINE_TYPE = 'FUNCTION' ORDER BY ROUTINE_SCHEMA, ROUTINE_NAME";

// Server-wide properties; one row set per section, a missing row leaves
// the section out.
const char* const kDescribeInstanceBatch =
    "SELECT CAST(SERVERPROPERTY('MachineName') AS NVARCHAR(128)) AS machine_name, "
    "CAST(SERVERPROPERTY('ServerName') AS NVARCHAR(128)) AS server_name, "
    "ISNULL(CAST(SERVERPROPERTY('InstanceName') AS NVARCHAR(128)), N'Default') AS instance_name, "
    "CAST(SERVERPROPERTY('ProductVersion') AS NVARCHAR(128)) AS product_version, "
    "CAST(SERVERPROPERTY('ProductLevel') AS NVARCHAR(128)) AS product_level, "
    "CAST(SERVERPROPERTY('Edition') AS NVARCHAR(128)) AS edition, "
    "CAST(SERVERPROPERTY('EngineEdition') AS INT) AS engine_edition, "
    "CAST(SERVERPROPERTY('Collation') AS NVARCHAR(128)) AS collation, "
    "CAST(ISNULL(SERVERPROPERTY('IsIntegratedSecurityOnly'), 0) AS BIT) AS is_windows_auth_only, "
    "CAST(ISNULL(SERVERPROPERTY('IsClustered'), 0) AS BIT) AS is_clustered, "
    "CAST(ISNULL(SERVERPROPERTY('IsHadrEnabled'), 0) AS BIT) AS is_hadr_enabled, "
    "CAST(ISNULL(SERVERPROPERTY('IsFullTextInstalled'), 0) AS BIT) AS is_fulltext_installed, "
    "@@VERSION AS version_string; "
    "SELECT "
    "(SELECT CAST(value_in_use AS INT) FROM sys.configurations WHERE name = 'max server memory (MB)') "
    "AS max_server_memory_mb, "
    "(SELECT CAST(value_in_use AS INT) FROM sys.configurations WHERE name = 'min server memory (MB)') "
    "AS min_server_memory_mb, "
    "(SELECT CAST(value_in_use AS INT) FROM sys.configurations WHERE name = 'max degree of parallelism') "
    "AS max_degree_of_parallelism, "
    "(SELECT CAST(value_in_use AS INT) FROM sys.configurations WHERE name = 'cost threshold for parallelism') "
    "AS cost_threshold_for_parallelism; "
    "SELECT cpu_count AS logical_cpu_count, hyperthread_ratio, "
    "physical_memory_kb / 1024 AS physical_memory_mb, virtual_memory_kb / 1024 AS virtual_memory_mb, "
    "committed_kb / 1024 AS committed_memory_mb, committed_target_kb / 1024 AS committed_target_mb "
    "FROM sys.dm_os_sys_info; "
    "SELECT COUNT(*) AS total_databases, "
    "SUM(CASE WHEN state_desc = 'ONLINE' THEN 1 ELSE 0 END) AS online_databases, "
    "SUM(CASE WHEN name NOT IN ('master', 'tempdb', 'model', 'msdb') THEN 1 ELSE 0 END) AS user_databases "
    "FROM sys.databases";

// Properties of the session's current database (DB_NAME() / DB_ID())
const char* const kDescribeDatabaseBatch =
    "SELECT db.name, db.database_id, db.create_date, db.compatibility_level, "
    "db.collation_name AS collation, db.user_access_desc AS user_access, db.is_read_only, "
    "db.is_auto_close_on, db.is_auto_shrink_on, db.state_desc AS state, "
    "db.recovery_model_desc AS recovery_model, SUSER_SNAME(db.owner_sid) AS owner, db.is_encrypted, "
    "CAST(CASE WHEN EXISTS (SELECT 1 FROM sys.change_tracking_databases ct "
    "WHERE ct.database_id = db.database_id) THEN 1 ELSE 0 END AS BIT) AS is_change_tracking_enabled "
    "FROM sys.databases db WHERE db.name = DB_NAME(); "
    "SELECT SUM(CAST(size AS BIGINT) * 8 / 1024) AS total_mb, "
    "SUM(CASE WHEN type = 0 THEN CAST(size AS BIGINT) * 8 / 1024 ELSE 0 END) AS data_mb, "
    "SUM(CASE WHEN type = 1 THEN CAST(size AS BIGINT) * 8 / 1024 ELSE 0 END) AS log_mb "
    "FROM sys.master_files WHERE database_id = DB_ID(); "
    "SELECT name AS file_name, physical_name, type_desc AS file_type, "
    "CAST(size AS BIGINT) * 8 / 1024 AS size_mb, "
    "CASE WHEN max_size = -1 THEN 'Unlimited' WHEN max_size = 0 THEN 'No Growth' "
    "ELSE CAST(CAST(max_size AS BIGINT) * 8 / 1024 AS VARCHAR(20)) + ' MB' END AS max_size, "
    "CASE WHEN is_percent_growth = 1 THEN CAST(growth AS VARCHAR(20)) + '%' "
    "ELSE CAST(CAST(growth AS BIGINT) * 8 / 1024 AS VARCHAR(20)) + ' MB' END AS growth_setting, "
    "state_desc AS state "
    "FROM sys.database_files ORDER BY type, file_id; "
    "SELECT (SELECT COUNT(*) FROM sys.tables WHERE is_ms_shipped = 0) AS tables, "
    "(SELECT COUNT(*) FROM sys.views WHERE is_ms_shipped = 0) AS views, "
    "(SELECT COUNT(*) FROM sys.procedures WHERE is_ms_shipped = 0) AS stored_procedures, "
    "(SELECT COUNT(*) FROM sys.objects WHERE type IN ('FN', 'IF', 'TF') AND is_ms_shipped = 0) AS functions, "
    "(SELECT COUNT(*) FROM sys.triggers WHERE is_ms_shipped = 0) AS triggers, "
    "(SELECT COUNT(DISTINCT name) FROM sys.schemas WHERE schema_id > 4) AS user_schemas; "
    "SELECT s.name, USER_NAME(s.principal_id) AS owner, s.schema_id "
    "FROM sys.schemas s WHERE s.schema_id > 4 ORDER BY s.name";

// Describe batches: the two markers bind @Name and @Schema (NULL = any
// schema); each SELECT is one row set, read back by position.
const std::string kDescribePreamble =
    "DECLARE @Name SYSNAME = ?; DECLARE @Schema SYSNAME = ?; ";

const std::string kDependenciesQuery =
    "SELECT DISTINCT SCHEMA_NAME(o.schema_id) AS referenced_schema, o.name AS referenced_object, "
    "o.type_desc AS object_type FROM sys.sql_expression_dependencies d "
    "INNER JOIN sys.objects o ON d.referenced_id = o.object_id WHERE d.referencing_id = @Id";

const std::string kDescribeProcedureBatch = kDescribePreamble +
    "DECLARE @Id INT = (SELECT TOP 1 p.object_id FROM sys.procedures p "
    "INNER JOIN sys.schemas s ON p.schema_id = s.schema_id "
    "WHERE p.name = @Name AND (s.name = @Schema OR @Schema IS NULL)); "
    "SELECT p.object_id AS id, p.name, s.name AS [schema], u.name AS owner, p.type, "
    "p.create_date, p.modify_date, ep.value AS description "
    "FROM sys.procedures p INNER JOIN sys.schemas s ON p.schema_id = s.schema_id "
    "LEFT JOIN sys.extended_properties ep ON ep.major_id = p.object_id AND ep.minor_id = 0 "
    "AND ep.name = 'MS_Description' "
    "LEFT JOIN sys.sysusers u ON p.principal_id = u.uid WHERE p.object_id = @Id; "
    "SELECT param.name, TYPE_NAME(param.user_type_id) AS type, param.max_length AS length, "
    "param.precision, param.scale, param.is_output, param.has_default_value, param.default_value "
    "FROM sys.parameters param WHERE param.object_id = @Id ORDER BY param.parameter_id; "
    "SELECT m.definition FROM sys.sql_modules m WHERE m.object_id = @Id; " +
    kDependenciesQuery;

const std::string kDescribeFunctionBatch = kDescribePreamble +
    "DECLARE @Id INT = (SELECT TOP 1 o.object_id FROM sys.objects o "
    "INNER JOIN sys.schemas s ON o.schema_id = s.schema_id "
    "WHERE o.type IN ('FN', 'IF', 'TF') AND o.name = @Name AND (s.name = @Schema OR @Schema IS NULL)); "
    "SELECT o.object_id AS id, o.name, s.name AS [schema], u.name AS owner, o.type, "
    "o.type_desc AS type_description, o.create_date, o.modify_date, ep.value AS description "
    "FROM sys.objects o INNER JOIN sys.schemas s ON o.schema_id = s.schema_id "
    "LEFT JOIN sys.extended_properties ep ON ep.major_id = o.object_id AND ep.minor_id = 0 "
    "AND ep.name = 'MS_Description' "
    "LEFT JOIN sys.sysusers u ON o.principal_id = u.uid WHERE o.object_id = @Id; "
    "SELECT param.name, TYPE_NAME(param.user_type_id) AS type, param.max_length AS length, "
    "param.precision, param.scale, param.has_default_value, param.default_value "
    "FROM sys.parameters param WHERE param.object_id = @Id AND param.parameter_id > 0 "
    "ORDER BY param.parameter_id; "
    "SELECT TYPE_NAME(param.user_type_id) AS type, param.max_length AS length, "
    "param.precision, param.scale "
    "FROM sys.parameters param WHERE param.object_id = @Id AND param.parameter_id = 0; "
    "SELECT c.name, TYPE_NAME(c.user_type_id) AS type, c.max_length AS length, c.precision, "
    "c.scale, c.is_nullable AS nullable FROM sys.columns c WHERE c.object_id = @Id "
    "ORDER BY c.column_id; "
    "SELECT m.definition FROM sys.sql_modules m WHERE m.object_id = @Id; " +
    kDependenciesQuery;

const std::string kDescribeViewBatch = kDescribePreamble +
    "DECLARE @Id INT = (SELECT TOP 1 v.object_id FROM sys.views v "
    "INNER JOIN sys.schemas s ON v.schema_id = s.schema_id "
    "WHERE v.name = @Name AND (s.name = @Schema OR @Schema IS NULL)); "
    "SELECT v.object_id AS id, v.name, s.name AS [schema], u.name AS owner, v.type, "
    "p.value AS description "
    "FROM sys.views v INNER JOIN sys.schemas s ON v.schema_id = s.schema_id "
    "LEFT JOIN sys.extended_properties p ON p.major_id = v.object_id AND p.minor_id = 0 "
    "AND p.name = 'MS_Description' "
    "LEFT JOIN sys.sysusers u ON v.principal_id = u.uid WHERE v.object_id = @Id; "
    "SELECT c.name, ty.name AS type, c.max_length AS length, c.precision, c.scale, "
    "c.is_nullable AS nullable, p.value AS description "
    "FROM sys.columns c INNER JOIN sys.types ty ON c.user_type_id = ty.user_type_id "
    "LEFT JOIN sys.extended_properties p ON p.major_id = c.object_id AND p.minor_id = c.column_id "
    "AND p.name = 'MS_Description' WHERE c.object_id = @Id ORDER BY c.column_id; "
    "SELECT i.name, i.type_desc AS type, p.value AS description, "
    "STUFF((SELECT ',' + c.name FROM sys.index_columns ic "
    "INNER JOIN sys.columns c ON ic.object_id = c.object_id AND ic.column_id = c.column_id "
    "WHERE ic.object_id = i.object_id AND ic.index_id = i.index_id ORDER BY ic.key_ordinal "
    "FOR XML PATH('')), 1, 1, '') AS keys "
    "FROM sys.indexes i "
    "LEFT JOIN sys.extended_properties p ON p.major_id = i.object_id AND p.minor_id = i.index_id "
    "AND p.name = 'MS_Description' WHERE i.object_id = @Id; "
    "SELECT m.definition FROM sys.sql_modules m WHERE m.object_id = @Id; " +
    kDependenciesQuery;

const engine::RowSet& row_set_at(const ExecutionOutput& output, size_t index) {
    if (index >= output.row_sets.size()) {
        throw engine::ExecutionFailure("Describe batch returned " +
                                       std::to_string(output.row_sets.size()) +
                                       " result sets, expected at least " + std::to_string(index + 1));
    }
    return output.row_sets[index];
}

nlohmann::ordered_json first_row(const engine::RowSet& row_set) {
    return engine::rows_to_json(row_set).at(0);
}

void set_first_row(nlohmann::ordered_json& data, const char* key, const engine::RowSet& row_set) {
    if (!row_set.rows.empty()) {
        data[key] = first_row(row_set);
    }
}

// Sets data["definition"] to the first row's only column when there is a row
void set_definition(nlohmann::ordered_json& data, const engine::RowSet& row_set) {
    if (!row_set.rows.empty() && !row_set.rows.front().empty()) {
        data["definition"] = engine::to_json(row_set.rows.front().front());
    }
}

std::string object_type(const engine::RowSet& info) {
    for (size_t i = 0; i < info.columns.size(); ++i) {
        if (info.columns[i] == "type" && !info.rows.empty()) {
            std::string type = info.rows.front()[i].to_sql_text();
            return type.substr(0, type.find_last_not_of(' ') + 1);
        }
    }
    return "";
}

} // anonymous namespace

DatabaseTools::DatabaseTools(engine::ConnectionProvider& provider)
    : provider_(provider) {
}

std::unique_ptr<engine::Session> DatabaseTools::acquire(const std::optional<std::string>& database) {
    if (database && !database->empty()) {
        return provider_.acquire(*database);
    }
    return provider_.acquire();
}

OperationResult DatabaseTools::list_databases() {
    try {
        auto session = provider_.acquire();
        ExecutionOutput output = session->execute(BoundStatement{kListDatabasesQuery, {}});
        return OperationResult::ok(engine::rows_to_json(row_set_at(output, 0)));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("ListDatabases failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult DatabaseTools::describe_instance() {
    try {
        auto session = provider_.acquire();
        ExecutionOutput output = session->execute(BoundStatement{kDescribeInstanceBatch, {}});

        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        set_first_row(data, "instance", row_set_at(output, 0));
        set_first_row(data, "configuration", row_set_at(output, 1));
        set_first_row(data, "resources", row_set_at(output, 2));
        set_first_row(data, "database_summary", row_set_at(output, 3));
        return OperationResult::ok(std::move(data));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("DescribeInstance failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult DatabaseTools::describe_database(const std::optional<std::string>& database) {
    try {
        auto session = acquire(database);
        ExecutionOutput output = session->execute(BoundStatement{kDescribeDatabaseBatch, {}});

        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        set_first_row(data, "database", row_set_at(output, 0));
        set_first_row(data, "size", row_set_at(output, 1));
        data["files"] = engine::rows_to_json(row_set_at(output, 2));
        set_first_row(data, "object_counts", row_set_at(output, 3));
        data["schemas"] = engine::rows_to_json(row_set_at(output, 4));
        return OperationResult::ok(std::move(data));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("DescribeDatabase failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult DatabaseTools::list_views(const std::optional<std::string>& database) {
    return list_qualified_names("ListViews", kListViewsQuery, database);
}

OperationResult DatabaseTools::list_stored_procedures(const std::optional<std::string>& database) {
    return list_qualified_names("ListStoredProcedures", kListProceduresQuery, database);
}

OperationResult DatabaseTools::list_functions(const std::optional<std::string>& database) {
    return list_qualified_names("ListFunctions", kListFunctionsQuery, database);
}

OperationResult DatabaseTools::list_qualified_names(const char* operation, const char* query,
                                                    const std::optional<std::string>& database) {
    try {
        auto session = acquire(database);
        ExecutionOutput output = session->execute(BoundStatement{query, {}});

        nlohmann::ordered_json names = nlohmann::ordered_json::array();
        for (const auto& row : row_set_at(output, 0).rows) {
            names.push_back(row.at(0).to_sql_text() + "." + row.at(1).to_sql_text());
        }
        return OperationResult::ok(std::move(names));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string(operation) + " failed: " + e.what());
        return OperationResult::failure(e.what());
    }
}

ExecutionOutput DatabaseTools::run_describe(const RoutineReference& object, const std::string& batch,
                                            const std::optional<std::string>& database) {
    engine::BindParameter name;
    name.name = "@Name";
    name.value = SqlValue::text(object.name);

    engine::BindParameter schema;
    schema.name = "@Schema";
    schema.value = object.schema ? SqlValue::text(*object.schema) : SqlValue::null();

    auto session = acquire(database);
    return session->execute(BoundStatement{batch, {name, schema}});
}

OperationResult DatabaseTools::describe_stored_procedure(const std::string& name,
                                                         const std::optional<std::string>& database) {
    try {
        RoutineReference procedure = RoutineReference::parse(name);
        ExecutionOutput output = run_describe(procedure, kDescribeProcedureBatch, database);

        const engine::RowSet& info = row_set_at(output, 0);
        if (info.rows.empty()) {
            throw engine::NotFoundError("Stored procedure '" + procedure.name + "' not found.");
        }

        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["procedure"] = first_row(info);
        data["parameters"] = engine::rows_to_json(row_set_at(output, 1));
        set_definition(data, row_set_at(output, 2));
        data["dependencies"] = engine::rows_to_json(row_set_at(output, 3));
        return OperationResult::ok(std::move(data));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("DescribeStoredProcedure failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult DatabaseTools::describe_function(const std::string& name,
                                                 const std::optional<std::string>& database) {
    try {
        RoutineReference function = RoutineReference::parse(name);
        ExecutionOutput output = run_describe(function, kDescribeFunctionBatch, database);

        const engine::RowSet& info = row_set_at(output, 0);
        if (info.rows.empty()) {
            throw engine::NotFoundError("Function '" + function.name + "' not found.");
        }

        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["function"] = first_row(info);
        data["parameters"] = engine::rows_to_json(row_set_at(output, 1));

        const engine::RowSet& return_type = row_set_at(output, 2);
        if (!return_type.rows.empty()) {
            data["return_type"] = first_row(return_type);
        }

        std::string type = object_type(info);
        if (type == "IF" || type == "TF") {
            data["table_columns"] = engine::rows_to_json(row_set_at(output, 3));
        }

        set_definition(data, row_set_at(output, 4));
        data["dependencies"] = engine::rows_to_json(row_set_at(output, 5));
        return OperationResult::ok(std::move(data));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("DescribeFunction failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult DatabaseTools::describe_view(const std::string& name,
                                             const std::optional<std::string>& database) {
    try {
        RoutineReference view = RoutineReference::parse(name);
        ExecutionOutput output = run_describe(view, kDescribeViewBatch, database);

        const engine::RowSet& info = row_set_at(output, 0);
        if (info.rows.empty()) {
            throw engine::NotFoundError("View '" + view.name + "' not found.");
        }

        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["view"] = first_row(info);
        data["columns"] = engine::rows_to_json(row_set_at(output, 1));
        data["indexes"] = engine::rows_to_json(row_set_at(output, 2));
        set_definition(data, row_set_at(output, 3));
        data["dependencies"] = engine::rows_to_json(row_set_at(output, 4));
        return OperationResult::ok(std::move(data));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("DescribeView failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult DatabaseTools::insert_data(const std::string& sql,
                                           const std::optional<std::string>& database) {
    return execute_write("InsertData", sql, database, true);
}

OperationResult DatabaseTools::update_data(const std::string& sql,
                                           const std::optional<std::string>& database) {
    return execute_write("UpdateData", sql, database, true);
}

OperationResult DatabaseTools::create_table(const std::string& sql,
                                            const std::optional<std::string>& database) {
    return execute_write("CreateTable", sql, database, false);
}

OperationResult DatabaseTools::drop_table(const std::string& name,
                                          const std::optional<std::string>& database) {
    try {
        RoutineReference table = RoutineReference::parse(name);
        return execute_write("DropTable", "DROP TABLE IF EXISTS " + table.quoted(), database, false);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("DropTable failed: ") + e.what());
        return OperationResult::failure(e.what());
    }
}

OperationResult DatabaseTools::execute_write(const char* operation, const std::string& sql,
                                             const std::optional<std::string>& database,
                                             bool report_rows) {
    try {
        auto session = acquire(database);
        LOG_DEBUG(std::string(operation) + ": " + sql);
        ExecutionOutput output = session->execute(BoundStatement{sql, {}});
        // -1 (no count reported, e.g. under SET NOCOUNT ON) reads as 0
        std::int64_t rows = report_rows ? std::max<std::int64_t>(output.rows_affected, 0) : 0;
        return OperationResult::ok_rows(rows);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string(operation) + " failed: " + e.what());
        return OperationResult::failure(e.what());
    }
}

} // namespace mssql_mcp::tools
