#include <gtest/gtest.h>
#include "engine/errors.hpp"
#include "engine/parameter_decoder.hpp"
#include "engine/type_inference.hpp"

using namespace mssql_mcp::engine;

namespace {

const SqlValue& value_of(const ParameterMap& map, const std::string& key) {
    for (const auto& entry : map) {
        if (entry.first == key) {
            return entry.second;
        }
    }
    throw std::out_of_range("no parameter " + key);
}

} // anonymous namespace

TEST(ParameterDecoderTest, EmptyInputs) {
    EXPECT_TRUE(decode_parameters("").empty());
    EXPECT_TRUE(decode_parameters("   \n").empty());
    EXPECT_TRUE(decode_parameters("null").empty());
    EXPECT_TRUE(decode_parameters("{}").empty());
}

TEST(ParameterDecoderTest, ScalarKinds) {
    auto map = decode_parameters(
        R"({"i": 5, "b": true, "n": null, "d": 1.50, "s": "hello", "t": "2024-01-31T10:15:00"})");
    ASSERT_EQ(map.size(), 6u);

    EXPECT_EQ(value_of(map, "i"), SqlValue::integer(5));
    EXPECT_EQ(value_of(map, "b"), SqlValue::boolean(true));
    EXPECT_TRUE(value_of(map, "n").is_null());
    ASSERT_EQ(value_of(map, "d").kind(), SqlValueKind::Decimal);
    EXPECT_EQ(value_of(map, "d").as_decimal().text(), "1.50");
    EXPECT_EQ(value_of(map, "s"), SqlValue::text("hello"));
    ASSERT_EQ(value_of(map, "t").kind(), SqlValueKind::Temporal);
    EXPECT_EQ(value_of(map, "t").as_temporal().to_iso_string(), "2024-01-31T10:15:00");
}

TEST(ParameterDecoderTest, KeepsDocumentOrder) {
    auto map = decode_parameters(R"({"z": 1, "a": 2, "m": 3})");
    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(map[0].first, "z");
    EXPECT_EQ(map[1].first, "a");
    EXPECT_EQ(map[2].first, "m");
}

TEST(ParameterDecoderTest, DuplicateKeyKeepsFirstPositionLastValue) {
    auto map = decode_parameters(R"({"a": 1, "b": 2, "a": 3})");
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map[0].first, "a");
    EXPECT_EQ(map[0].second, SqlValue::integer(3));
    EXPECT_EQ(map[1].first, "b");
}

TEST(ParameterDecoderTest, ExponentAndLongFractionFallBackToFloat) {
    auto map = decode_parameters(
        R"({"e": 1.5e10, "long": 0.12345678901234567890123456789012})");
    ASSERT_EQ(value_of(map, "e").kind(), SqlValueKind::Float);
    EXPECT_DOUBLE_EQ(value_of(map, "e").as_float(), 1.5e10);
    EXPECT_EQ(value_of(map, "long").kind(), SqlValueKind::Float);
}

TEST(ParameterDecoderTest, DecimalScaleFitsDeclaredType) {
    auto map = decode_parameters(
        R"({"ten": 0.0000000001, "twelve": 0.000000000001, "wide": 12345678901234567890123456789.5})");

    const SqlValue& ten = value_of(map, "ten");
    ASSERT_EQ(ten.kind(), SqlValueKind::Decimal);
    EXPECT_LE(ten.as_decimal().scale(), infer_sql_type(ten).scale);

    // More fraction digits than DECIMAL(38,10) keeps, or more than 28
    // integer digits, would be rounded by the declared variable
    const SqlValue& twelve = value_of(map, "twelve");
    ASSERT_EQ(twelve.kind(), SqlValueKind::Float);
    EXPECT_DOUBLE_EQ(twelve.as_float(), 0.000000000001);
    EXPECT_EQ(infer_sql_type(twelve).declaration(), "FLOAT");
    EXPECT_EQ(value_of(map, "wide").kind(), SqlValueKind::Float);
}

TEST(ParameterDecoderTest, LargeUnsignedBecomesDecimal) {
    auto map = decode_parameters(R"({"big": 18446744073709551615, "max": 9223372036854775807})");
    ASSERT_EQ(value_of(map, "big").kind(), SqlValueKind::Decimal);
    EXPECT_EQ(value_of(map, "big").as_decimal().text(), "18446744073709551615");
    EXPECT_EQ(value_of(map, "max"), SqlValue::integer(9223372036854775807LL));
}

TEST(ParameterDecoderTest, NestedValuesBecomeJsonText) {
    auto map = decode_parameters(R"({"obj": {"x": [1, 2], "y": "z"}, "arr": [true, null]})");
    EXPECT_EQ(value_of(map, "obj"), SqlValue::text(R"({"x":[1,2],"y":"z"})"));
    EXPECT_EQ(value_of(map, "arr"), SqlValue::text("[true,null]"));
}

TEST(ParameterDecoderTest, DateLikeButInvalidStaysText) {
    auto map = decode_parameters(R"({"d": "2023-02-29"})");
    EXPECT_EQ(value_of(map, "d"), SqlValue::text("2023-02-29"));
}

TEST(ParameterDecoderTest, MalformedJsonThrows) {
    try {
        decode_parameters("{bad");
        FAIL() << "Expected MalformedParameters";
    } catch (const MalformedParameters& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Invalid parameter JSON: ", 0), 0u);
        EXPECT_FALSE(e.decoder_message().empty());
    }
}

TEST(ParameterDecoderTest, NonObjectDocumentsThrow) {
    EXPECT_THROW(decode_parameters("[1, 2]"), MalformedParameters);
    EXPECT_THROW(decode_parameters("42"), MalformedParameters);
    EXPECT_THROW(decode_parameters("\"text\""), MalformedParameters);
}

TEST(ParameterDecoderTest, ClassifyParameterText) {
    EXPECT_EQ(classify_parameter_text(""), ParameterShape::Empty);
    EXPECT_EQ(classify_parameter_text("  null "), ParameterShape::Empty);
    EXPECT_EQ(classify_parameter_text(R"( {"a": 1})"), ParameterShape::JsonMap);
    EXPECT_EQ(classify_parameter_text("'a', 1"), ParameterShape::LiteralList);
    EXPECT_EQ(classify_parameter_text("[1]"), ParameterShape::LiteralList);
}
