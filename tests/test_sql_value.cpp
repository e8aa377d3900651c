#include <gtest/gtest.h>
#include "engine/sql_value.hpp"

using namespace mssql_mcp::engine;

TEST(DecimalTest, ParseCanonicalizes) {
    EXPECT_EQ(Decimal::parse("+1.50")->text(), "1.50");
    EXPECT_EQ(Decimal::parse(".5")->text(), "0.5");
    EXPECT_EQ(Decimal::parse("-000.10")->text(), "-0.10");
    EXPECT_EQ(Decimal::parse(" 12 ")->text(), "12");
}

TEST(DecimalTest, NegativeZeroLosesSign) {
    auto d = Decimal::parse("-0.00");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->text(), "0.00");
    EXPECT_FALSE(d->is_negative());
}

TEST(DecimalTest, RejectsNonNumbers) {
    EXPECT_FALSE(Decimal::parse("").has_value());
    EXPECT_FALSE(Decimal::parse("abc").has_value());
    EXPECT_FALSE(Decimal::parse("1.2.3").has_value());
    EXPECT_FALSE(Decimal::parse("1e5").has_value());
    EXPECT_FALSE(Decimal::parse("-").has_value());
}

TEST(DecimalTest, PrecisionAndScale) {
    auto d = Decimal::parse("123.45");
    EXPECT_EQ(d->precision(), 5);
    EXPECT_EQ(d->scale(), 2);

    EXPECT_EQ(Decimal::parse("0.5")->precision(), 1);
    EXPECT_EQ(Decimal::parse("0")->precision(), 1);
    EXPECT_EQ(Decimal::parse("-42")->precision(), 2);
}

TEST(TemporalTest, ParseDate) {
    auto t = parse_temporal("2024-01-31");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->kind, TemporalKind::Date);
    EXPECT_EQ(t->year, 2024);
    EXPECT_EQ(t->month, 1u);
    EXPECT_EQ(t->day, 31u);
    EXPECT_EQ(t->to_iso_string(), "2024-01-31");
}

TEST(TemporalTest, ParseDateTimeWithFraction) {
    auto t = parse_temporal("2024-01-31T10:15:00.1234567");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->kind, TemporalKind::DateTime);
    EXPECT_EQ(t->fraction_ns, 123456700u);
    EXPECT_EQ(t->to_iso_string(), "2024-01-31T10:15:00.1234567");
}

TEST(TemporalTest, SpaceSeparatorAndShortTime) {
    auto t = parse_temporal("2024-01-31 10:15");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->hour, 10u);
    EXPECT_EQ(t->minute, 15u);
    EXPECT_EQ(t->second, 0u);
    EXPECT_EQ(t->to_iso_string(), "2024-01-31T10:15:00");
}

TEST(TemporalTest, CalendarValidation) {
    EXPECT_TRUE(parse_temporal("2024-02-29").has_value());
    EXPECT_FALSE(parse_temporal("2023-02-29").has_value());
    EXPECT_FALSE(parse_temporal("2024-13-01").has_value());
    EXPECT_FALSE(parse_temporal("2024-04-31").has_value());
    EXPECT_FALSE(parse_temporal("2024-01-31T24:00:00").has_value());
}

TEST(TemporalTest, NotTemporal) {
    EXPECT_FALSE(parse_temporal("hello").has_value());
    EXPECT_FALSE(parse_temporal("10:15").has_value());
    EXPECT_FALSE(parse_temporal("2024-1-31").has_value());
    EXPECT_FALSE(parse_temporal("2024-01-31Z").has_value());
}

TEST(TemporalTest, TimeOfDay) {
    auto t = parse_time_of_day("10:15:00.5");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->kind, TemporalKind::Time);
    EXPECT_EQ(t->fraction_ns, 500000000u);
    EXPECT_EQ(t->to_iso_string(), "10:15:00.5");

    EXPECT_FALSE(parse_time_of_day("25:00").has_value());
}

TEST(SqlValueTest, KindFollowsFactory) {
    EXPECT_TRUE(SqlValue().is_null());
    EXPECT_EQ(SqlValue::integer(1).kind(), SqlValueKind::Integer);
    EXPECT_EQ(SqlValue::floating(1.5).kind(), SqlValueKind::Float);
    EXPECT_EQ(SqlValue::boolean(true).kind(), SqlValueKind::Bool);
    EXPECT_EQ(SqlValue::text("x").kind(), SqlValueKind::Text);
    EXPECT_STREQ(kind_to_string(SqlValueKind::Temporal), "Temporal");
}

TEST(SqlValueTest, SqlText) {
    EXPECT_EQ(SqlValue::null().to_sql_text(), "");
    EXPECT_EQ(SqlValue::integer(-7).to_sql_text(), "-7");
    EXPECT_EQ(SqlValue::floating(2.5).to_sql_text(), "2.5");
    EXPECT_EQ(SqlValue::boolean(true).to_sql_text(), "1");
    EXPECT_EQ(SqlValue::boolean(false).to_sql_text(), "0");
    EXPECT_EQ(SqlValue::temporal(*parse_temporal("2024-01-31T10:15:00")).to_sql_text(),
              "2024-01-31 10:15:00");
}

TEST(SqlValueTest, JsonKeepsSemanticType) {
    EXPECT_TRUE(to_json(SqlValue::null()).is_null());
    EXPECT_EQ(to_json(SqlValue::integer(42)), 42);
    EXPECT_EQ(to_json(SqlValue::boolean(true)), true);
    EXPECT_EQ(to_json(SqlValue::text("abc")), "abc");
    EXPECT_EQ(to_json(SqlValue::temporal(*parse_temporal("2024-01-31"))), "2024-01-31");
}

TEST(SqlValueTest, DecimalJson) {
    auto whole = to_json(SqlValue::decimal(*Decimal::parse("12")));
    EXPECT_TRUE(whole.is_number_integer());
    EXPECT_EQ(whole, 12);

    auto fractional = to_json(SqlValue::decimal(*Decimal::parse("108.0000000000")));
    EXPECT_TRUE(fractional.is_number_float());
    EXPECT_DOUBLE_EQ(fractional.get<double>(), 108.0);
}

TEST(SqlValueTest, Utf16Length) {
    EXPECT_EQ(utf16_length(""), 0u);
    EXPECT_EQ(utf16_length("abc"), 3u);
    EXPECT_EQ(utf16_length("h\xC3\xA9llo"), 5u);           // é
    EXPECT_EQ(utf16_length("\xF0\x9F\x98\x80"), 2u);        // surrogate pair
}
