#include <gtest/gtest.h>
#include "db/odbc_value_codec.hpp"
#include "core/sqlwchar_utils.hpp"
#include "engine/errors.hpp"
#include <cstring>

using namespace mssql_mcp;
using namespace mssql_mcp::db;
using engine::BindParameter;
using engine::ParameterDirection;
using engine::SqlTypeDescriptor;
using engine::SqlTypeTag;
using engine::SqlValue;

namespace {

BindParameter input(SqlValue value) {
    BindParameter parameter;
    parameter.name = "@p0";
    parameter.value = std::move(value);
    return parameter;
}

BindParameter output(SqlValue value, SqlTypeDescriptor type) {
    BindParameter parameter = input(std::move(value));
    parameter.direction = ParameterDirection::InputOutput;
    parameter.declared_type = type;
    return parameter;
}

} // anonymous namespace

TEST(OdbcValueCodecTest, NullInput) {
    auto buffer = make_parameter_buffer(input(SqlValue::null()));
    EXPECT_EQ(buffer.io_type, SQL_PARAM_INPUT);
    EXPECT_EQ(buffer.indicator, SQL_NULL_DATA);
}

TEST(OdbcValueCodecTest, IntegerInput) {
    auto buffer = make_parameter_buffer(input(SqlValue::integer(-42)));
    EXPECT_EQ(buffer.c_type, SQL_C_SBIGINT);
    EXPECT_EQ(buffer.sql_type, SQL_BIGINT);
    ASSERT_EQ(buffer.storage.size(), sizeof(SQLBIGINT));
    SQLBIGINT stored = 0;
    std::memcpy(&stored, buffer.storage.data(), sizeof(stored));
    EXPECT_EQ(stored, -42);
}

TEST(OdbcValueCodecTest, DecimalInputKeepsScale) {
    auto buffer = make_parameter_buffer(input(SqlValue::decimal(*engine::Decimal::parse("100.05"))));
    EXPECT_EQ(buffer.c_type, SQL_C_CHAR);
    EXPECT_EQ(buffer.sql_type, SQL_DECIMAL);
    EXPECT_EQ(buffer.column_size, 38u);
    EXPECT_EQ(buffer.decimal_digits, 2);
    EXPECT_STREQ(reinterpret_cast<const char*>(buffer.storage.data()), "100.05");
    EXPECT_EQ(buffer.indicator, SQL_NTS);
}

TEST(OdbcValueCodecTest, TextInputIsWide) {
    auto buffer = make_parameter_buffer(input(SqlValue::text("h\xC3\xA9llo")));
    EXPECT_EQ(buffer.c_type, SQL_C_WCHAR);
    EXPECT_EQ(buffer.sql_type, SQL_WVARCHAR);
    EXPECT_EQ(buffer.column_size, 5u);
    EXPECT_EQ(buffer.indicator, static_cast<SQLLEN>(5 * sizeof(SQLWCHAR)));
    const auto* wide = reinterpret_cast<const SQLWCHAR*>(buffer.storage.data());
    EXPECT_EQ(wide[1], 0x00E9);
}

TEST(OdbcValueCodecTest, LongTextInputIsLongVarchar) {
    auto buffer = make_parameter_buffer(input(SqlValue::text(std::string(4001, 'x'))));
    EXPECT_EQ(buffer.sql_type, SQL_WLONGVARCHAR);
}

TEST(OdbcValueCodecTest, TemporalInputTruncatesTo100ns) {
    auto t = engine::parse_temporal("2024-01-31T10:15:00.1234567");
    t->fraction_ns += 89;
    auto buffer = make_parameter_buffer(input(SqlValue::temporal(*t)));
    EXPECT_EQ(buffer.c_type, SQL_C_TYPE_TIMESTAMP);

    SQL_TIMESTAMP_STRUCT ts{};
    std::memcpy(&ts, buffer.storage.data(), sizeof(ts));
    EXPECT_EQ(ts.year, 2024);
    EXPECT_EQ(ts.hour, 10);
    EXPECT_EQ(ts.fraction, 123456700u);
}

TEST(OdbcValueCodecTest, ReturnValueBuffer) {
    BindParameter parameter;
    parameter.name = "@RETURN_VALUE";
    parameter.direction = ParameterDirection::ReturnValue;
    auto buffer = make_parameter_buffer(parameter);
    EXPECT_EQ(buffer.io_type, SQL_PARAM_OUTPUT);
    EXPECT_EQ(buffer.c_type, SQL_C_SLONG);

    SQLINTEGER code = 5;
    std::memcpy(buffer.storage.data(), &code, sizeof(code));
    EXPECT_EQ(read_parameter_value(buffer, parameter), SqlValue::integer(5));
}

TEST(OdbcValueCodecTest, DeclaredDecimalOutputRoundTrip) {
    auto parameter = output(SqlValue::null(), SqlTypeDescriptor::decimal(18, 2));
    auto buffer = make_parameter_buffer(parameter);
    EXPECT_EQ(buffer.io_type, SQL_PARAM_INPUT_OUTPUT);
    EXPECT_EQ(buffer.c_type, SQL_C_CHAR);
    EXPECT_EQ(buffer.column_size, 18u);
    EXPECT_EQ(buffer.decimal_digits, 2);
    EXPECT_EQ(buffer.indicator, SQL_NULL_DATA);
    EXPECT_GE(buffer.storage.size(), 128u);

    // What the driver leaves behind after execution
    std::memcpy(buffer.storage.data(), "99.95", 6);
    buffer.indicator = 5;
    SqlValue value = read_parameter_value(buffer, parameter);
    ASSERT_EQ(value.kind(), engine::SqlValueKind::Decimal);
    EXPECT_EQ(value.as_decimal().text(), "99.95");
}

TEST(OdbcValueCodecTest, DeclaredNVarCharOutput) {
    auto parameter = output(SqlValue::text("in"), SqlTypeDescriptor::nvarchar(100));
    auto buffer = make_parameter_buffer(parameter);
    EXPECT_EQ(buffer.c_type, SQL_C_WCHAR);
    EXPECT_EQ(buffer.column_size, 100u);
    EXPECT_GE(buffer.storage.size(), 101 * sizeof(SQLWCHAR));

    std::vector<SQLWCHAR> result = core::to_sqlwchar("Shipped");
    std::memcpy(buffer.storage.data(), result.data(), result.size() * sizeof(SQLWCHAR));
    buffer.indicator = static_cast<SQLLEN>(7 * sizeof(SQLWCHAR));
    EXPECT_EQ(read_parameter_value(buffer, parameter), SqlValue::text("Shipped"));
}

TEST(OdbcValueCodecTest, FloatOutputInExponentForm) {
    auto parameter = output(SqlValue::null(), SqlTypeDescriptor::of(SqlTypeTag::Float));
    auto buffer = make_parameter_buffer(parameter);
    EXPECT_EQ(buffer.sql_type, SQL_DOUBLE);

    std::memcpy(buffer.storage.data(), "1.5E+20", 8);
    buffer.indicator = 7;
    SqlValue value = read_parameter_value(buffer, parameter);
    ASSERT_EQ(value.kind(), engine::SqlValueKind::Float);
    EXPECT_DOUBLE_EQ(value.as_float(), 1.5e20);

    std::memcpy(buffer.storage.data(), "-2.5E-7", 8);
    EXPECT_DOUBLE_EQ(read_parameter_value(buffer, parameter).as_float(), -2.5e-7);
}

TEST(OdbcValueCodecTest, MaxNVarCharOutputIsUnlimited) {
    auto parameter = output(SqlValue::text("seed"),
                            SqlTypeDescriptor::nvarchar(SqlTypeDescriptor::kMaxLength));
    auto buffer = make_parameter_buffer(parameter);
    EXPECT_EQ(buffer.c_type, SQL_C_WCHAR);
    EXPECT_EQ(buffer.column_size, 0u);
    EXPECT_GT(buffer.storage.size(), 4001 * sizeof(SQLWCHAR));

    std::string long_text(10000, 'y');
    std::vector<SQLWCHAR> result = core::to_sqlwchar(long_text);
    std::memcpy(buffer.storage.data(), result.data(), result.size() * sizeof(SQLWCHAR));
    buffer.indicator = static_cast<SQLLEN>(long_text.size() * sizeof(SQLWCHAR));
    EXPECT_EQ(read_parameter_value(buffer, parameter), SqlValue::text(long_text));
}

TEST(OdbcValueCodecTest, OverlongOutputIsAnError) {
    auto wide_parameter = output(SqlValue::null(), SqlTypeDescriptor::nvarchar(10));
    auto wide = make_parameter_buffer(wide_parameter);
    wide.indicator = static_cast<SQLLEN>(25 * sizeof(SQLWCHAR));
    EXPECT_THROW(read_parameter_value(wide, wide_parameter), engine::ExecutionFailure);

    auto narrow_parameter = output(SqlValue::null(), SqlTypeDescriptor::decimal(18, 2));
    auto narrow = make_parameter_buffer(narrow_parameter);
    narrow.indicator = static_cast<SQLLEN>(narrow.storage.size());
    EXPECT_THROW(read_parameter_value(narrow, narrow_parameter), engine::ExecutionFailure);
}

TEST(OdbcValueCodecTest, NullOutputReadsAsNull) {
    auto parameter = output(SqlValue::integer(1), SqlTypeDescriptor::of(SqlTypeTag::Int));
    auto buffer = make_parameter_buffer(parameter);
    buffer.indicator = SQL_NULL_DATA;
    EXPECT_TRUE(read_parameter_value(buffer, parameter).is_null());
}

TEST(OdbcValueCodecTest, DescribeOdbcType) {
    EXPECT_EQ(describe_odbc_type(SQL_INTEGER, 10, 0).declaration(), "INT");
    EXPECT_EQ(describe_odbc_type(SQL_BIGINT, 19, 0).declaration(), "BIGINT");
    EXPECT_EQ(describe_odbc_type(SQL_DECIMAL, 18, 2).declaration(), "DECIMAL(18,2)");
    EXPECT_EQ(describe_odbc_type(SQL_WVARCHAR, 100, 0).declaration(), "NVARCHAR(100)");
    EXPECT_EQ(describe_odbc_type(SQL_WVARCHAR, 0, 0).declaration(), "NVARCHAR(MAX)");
    EXPECT_EQ(describe_odbc_type(SQL_TYPE_TIMESTAMP, 27, 7).declaration(), "DATETIME2");
    EXPECT_EQ(describe_odbc_type(SQL_BIT, 1, 0).declaration(), "BIT");
    EXPECT_EQ(describe_odbc_type(SQL_GUID, 36, 0).declaration(), "SQL_VARIANT");
}
