#include <gtest/gtest.h>
#include "tools/database_tools.hpp"
#include "core/logger.hpp"
#include "fake_session.hpp"

using namespace mssql_mcp;
using engine::ExecutionOutput;
using engine::SqlValue;
using test::make_row_set;

class DatabaseToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_enabled(false);
    }

    void TearDown() override {
        core::Logger::instance().set_console_enabled(true);
    }

    void script(std::vector<engine::RowSet> row_sets, std::int64_t rows_affected = -1) {
        ExecutionOutput output;
        output.row_sets = std::move(row_sets);
        output.rows_affected = rows_affected;
        provider.script.outputs.push_back(std::move(output));
    }

    test::FakeConnectionProvider provider;
    tools::DatabaseTools tools{provider};
};

TEST_F(DatabaseToolsTest, ListDatabases) {
    script({make_row_set({"name", "database_id"}, {
        {SqlValue::text("master"), SqlValue::integer(1)},
        {SqlValue::text("Sales"), SqlValue::integer(5)},
    })});

    auto result = tools.list_databases();

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.data()->dump(),
              R"([{"name":"master","database_id":1},{"name":"Sales","database_id":5}])");
    EXPECT_NE(provider.script.statements[0].sql.find("sys.databases"), std::string::npos);
    EXPECT_FALSE(provider.script.databases[0].has_value());
}

TEST_F(DatabaseToolsTest, DescribeInstanceSections) {
    script({
        make_row_set({"server_name", "instance_name", "is_clustered"}, {
            {SqlValue::text("db1"), SqlValue::text("Default"), SqlValue::boolean(false)},
        }),
        make_row_set({"max_server_memory_mb", "max_degree_of_parallelism"}, {
            {SqlValue::integer(2147483647), SqlValue::integer(0)},
        }),
        make_row_set({"logical_cpu_count"}),
        make_row_set({"total_databases", "online_databases", "user_databases"}, {
            {SqlValue::integer(6), SqlValue::integer(6), SqlValue::integer(2)},
        }),
    });

    auto result = tools.describe_instance();

    ASSERT_TRUE(result.success()) << *result.error();
    const auto& data = *result.data();
    EXPECT_EQ(data["instance"]["server_name"], "db1");
    EXPECT_EQ(data["instance"]["is_clustered"], false);
    EXPECT_EQ(data["configuration"]["max_degree_of_parallelism"], 0);
    // A section without a row is left out
    EXPECT_FALSE(data.contains("resources"));
    EXPECT_EQ(data["database_summary"]["user_databases"], 2);
    EXPECT_FALSE(provider.script.databases[0].has_value());
    EXPECT_NE(provider.script.statements[0].sql.find("SERVERPROPERTY('ProductVersion')"), std::string::npos);
}

TEST_F(DatabaseToolsTest, DescribeDatabaseSections) {
    script({
        make_row_set({"name", "is_read_only", "is_change_tracking_enabled"}, {
            {SqlValue::text("Sales"), SqlValue::boolean(false), SqlValue::boolean(true)},
        }),
        make_row_set({"total_mb", "data_mb", "log_mb"}, {
            {SqlValue::integer(16), SqlValue::integer(8), SqlValue::integer(8)},
        }),
        make_row_set({"file_name", "max_size"}, {
            {SqlValue::text("Sales"), SqlValue::text("Unlimited")},
            {SqlValue::text("Sales_log"), SqlValue::text("2097152 MB")},
        }),
        make_row_set({"tables", "views"}, {{SqlValue::integer(12), SqlValue::integer(3)}}),
        make_row_set({"name", "owner", "schema_id"}),
    });

    auto result = tools.describe_database(std::string("Sales"));

    ASSERT_TRUE(result.success()) << *result.error();
    const auto& data = *result.data();
    EXPECT_EQ(data["database"]["name"], "Sales");
    EXPECT_EQ(data["database"]["is_change_tracking_enabled"], true);
    EXPECT_EQ(data["size"]["total_mb"], 16);
    ASSERT_EQ(data["files"].size(), 2u);
    EXPECT_EQ(data["files"][1]["file_name"], "Sales_log");
    EXPECT_EQ(data["object_counts"]["tables"], 12);
    EXPECT_TRUE(data["schemas"].is_array());
    EXPECT_TRUE(data["schemas"].empty());
    EXPECT_EQ(provider.script.databases[0], std::optional<std::string>("Sales"));
}

TEST_F(DatabaseToolsTest, DescribeDatabaseFailure) {
    provider.script.execute_failure = engine::ExecutionFailure("Login failed for user 'app'.");

    auto result = tools.describe_database();
    EXPECT_FALSE(result.success());
    EXPECT_EQ(*result.error(), "Login failed for user 'app'.");
}

TEST_F(DatabaseToolsTest, ListViewsAsQualifiedNames) {
    script({make_row_set({"TABLE_SCHEMA", "TABLE_NAME"}, {
        {SqlValue::text("dbo"), SqlValue::text("ActiveOrders")},
        {SqlValue::text("sales"), SqlValue::text("Totals")},
    })});

    auto result = tools.list_views(std::string("Sales"));

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.data()->dump(), R"(["dbo.ActiveOrders","sales.Totals"])");
    EXPECT_EQ(provider.script.databases[0], std::optional<std::string>("Sales"));
}

TEST_F(DatabaseToolsTest, ListProceduresAndFunctionsFilterByRoutineType) {
    script({make_row_set({"ROUTINE_SCHEMA", "ROUTINE_NAME"})});
    script({make_row_set({"ROUTINE_SCHEMA", "ROUTINE_NAME"})});

    auto procedures = tools.list_stored_procedures();
    auto functions = tools.list_functions();

    ASSERT_TRUE(procedures.success());
    EXPECT_EQ(procedures.data()->dump(), "[]");
    EXPECT_NE(provider.script.statements[0].sql.find("ROUTINE_TYPE = 'PROCEDURE'"), std::string::npos);
    EXPECT_NE(provider.script.statements[1].sql.find("ROUTINE_TYPE = 'FUNCTION'"), std::string::npos);
    EXPECT_TRUE(functions.success());
}

TEST_F(DatabaseToolsTest, DescribeProcedureBindsNameAndSchema) {
    script({
        make_row_set({"id", "name", "schema"}, {
            {SqlValue::integer(101), SqlValue::text("GetOrders"), SqlValue::text("sales")},
        }),
        make_row_set({"name", "type", "is_output"}, {
            {SqlValue::text("@CustomerId"), SqlValue::text("int"), SqlValue::boolean(false)},
        }),
        make_row_set({"definition"}, {{SqlValue::text("CREATE PROCEDURE sales.GetOrders ...")}}),
        make_row_set({"referenced_schema", "referenced_object", "object_type"}),
    });

    auto result = tools.describe_stored_procedure("sales.GetOrders");

    ASSERT_TRUE(result.success()) << *result.error();
    const auto& data = *result.data();
    EXPECT_EQ(data["procedure"]["id"], 101);
    EXPECT_EQ(data["parameters"][0]["name"], "@CustomerId");
    EXPECT_EQ(data["definition"], "CREATE PROCEDURE sales.GetOrders ...");
    EXPECT_TRUE(data["dependencies"].empty());

    const auto& parameters = provider.script.statements[0].parameters;
    ASSERT_EQ(parameters.size(), 2u);
    EXPECT_EQ(parameters[0].value, SqlValue::text("GetOrders"));
    EXPECT_EQ(parameters[1].value, SqlValue::text("sales"));
}

TEST_F(DatabaseToolsTest, DescribeProcedureWithoutSchemaBindsNull) {
    script({make_row_set({"id"}), make_row_set({"name"}), make_row_set({"definition"}),
            make_row_set({"referenced_object"})});

    auto result = tools.describe_stored_procedure("Missing");

    EXPECT_FALSE(result.success());
    EXPECT_EQ(*result.error(), "Stored procedure 'Missing' not found.");
    EXPECT_TRUE(provider.script.statements[0].parameters[1].value.is_null());
}

TEST_F(DatabaseToolsTest, DescribeTableFunctionIncludesColumns) {
    script({
        make_row_set({"id", "name", "type"}, {
            {SqlValue::integer(7), SqlValue::text("OrdersBetween"), SqlValue::text("TF")},
        }),
        make_row_set({"name", "type"}, {{SqlValue::text("@From"), SqlValue::text("date")}}),
        make_row_set({"type"}),
        make_row_set({"name", "type"}, {{SqlValue::text("OrderId"), SqlValue::text("int")}}),
        make_row_set({"definition"}),
        make_row_set({"referenced_object"}),
    });

    auto result = tools.describe_function("OrdersBetween");

    ASSERT_TRUE(result.success());
    const auto& data = *result.data();
    EXPECT_FALSE(data.contains("return_type"));
    ASSERT_TRUE(data.contains("table_columns"));
    EXPECT_EQ(data["table_columns"][0]["name"], "OrderId");
    EXPECT_FALSE(data.contains("definition"));
}

TEST_F(DatabaseToolsTest, DescribeScalarFunctionHasReturnType) {
    script({
        make_row_set({"id", "name", "type"}, {
            {SqlValue::integer(8), SqlValue::text("AddTax"), SqlValue::text("FN")},
        }),
        make_row_set({"name"}),
        make_row_set({"type", "precision"}, {{SqlValue::text("decimal"), SqlValue::integer(18)}}),
        make_row_set({"name"}),
        make_row_set({"definition"}, {{SqlValue::text("CREATE FUNCTION ...")}}),
        make_row_set({"referenced_object"}),
    });

    auto result = tools.describe_function("dbo.AddTax");

    ASSERT_TRUE(result.success());
    const auto& data = *result.data();
    EXPECT_EQ(data["return_type"]["type"], "decimal");
    EXPECT_FALSE(data.contains("table_columns"));
    EXPECT_EQ(data["definition"], "CREATE FUNCTION ...");
}

TEST_F(DatabaseToolsTest, DescribeViewNotFound) {
    script({make_row_set({"id"}), make_row_set({"name"}), make_row_set({"name"}),
            make_row_set({"definition"}), make_row_set({"referenced_object"})});

    auto result = tools.describe_view("dbo.Nope");
    EXPECT_FALSE(result.success());
    EXPECT_EQ(*result.error(), "View 'Nope' not found.");
}

TEST_F(DatabaseToolsTest, DescribeWithTooFewResultSets) {
    script({make_row_set({"id"}, {{SqlValue::integer(1)}})});

    auto result = tools.describe_view("ActiveOrders");
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.error()->find("expected at least 2"), std::string::npos);
}

TEST_F(DatabaseToolsTest, InsertReportsRowsAffected) {
    script({}, 3);

    auto result = tools.insert_data("INSERT INTO Items (Name) VALUES ('a'), ('b'), ('c')");

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.to_json().dump(),
              R"({"success":true,"data":{"rows_affected":3},"rowsAffected":3})");
    EXPECT_EQ(provider.script.statements[0].sql, "INSERT INTO Items (Name) VALUES ('a'), ('b'), ('c')");
}

TEST_F(DatabaseToolsTest, UpdateWithoutRowCountReportsZero) {
    script({}, -1);

    auto result = tools.update_data("SET NOCOUNT ON; UPDATE Items SET Name = 'x'");

    ASSERT_TRUE(result.success());
    EXPECT_EQ(*result.rows_affected(), 0);
    EXPECT_EQ(result.to_json().dump(),
              R"({"success":true,"data":{"rows_affected":0},"rowsAffected":0})");
}

TEST_F(DatabaseToolsTest, CreateAndDropReportZeroRows) {
    script({}, -1);
    script({}, -1);

    auto created = tools.create_table("CREATE TABLE Temp (Id INT)");
    auto dropped = tools.drop_table("Temp]x");

    EXPECT_EQ(*created.rows_affected(), 0);
    EXPECT_EQ(*dropped.rows_affected(), 0);
    EXPECT_EQ(provider.script.statements[1].sql, "DROP TABLE IF EXISTS [Temp]]x]");
}

TEST_F(DatabaseToolsTest, UpdateFailureIsReported) {
    provider.script.execute_failure = engine::ExecutionFailure("Invalid object name 'Nope'.");

    auto result = tools.update_data("UPDATE Nope SET x = 1");
    EXPECT_FALSE(result.success());
    EXPECT_EQ(*result.error(), "Invalid object name 'Nope'.");
    EXPECT_FALSE(result.rows_affected().has_value());
}
