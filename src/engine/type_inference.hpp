#pragma once

#include "sql_value.hpp"
#include <string>

namespace mssql_mcp::engine {

enum class SqlTypeTag { Variant, Int, BigInt, Decimal, Float, Bit, NVarChar, DateTime2 };

// Native type used to declare an intermediate variable or to bind a
// declared routine parameter.
struct SqlTypeDescriptor {
    static constexpr int kMaxLength = -1;

    SqlTypeTag tag = SqlTypeTag::Variant;
    int length = 0;      // NVARCHAR characters, kMaxLength for MAX
    int precision = 0;   // DECIMAL only
    int scale = 0;       // DECIMAL only

    static SqlTypeDescriptor of(SqlTypeTag tag);
    static SqlTypeDescriptor decimal(int precision, int scale);
    static SqlTypeDescriptor nvarchar(int length);

    // T-SQL spelling: "INT", "DECIMAL(38,10)", "NVARCHAR(50)", "NVARCHAR(MAX)"
    std::string declaration() const;

    bool operator==(const SqlTypeDescriptor& other) const {
        return tag == other.tag && length == other.length &&
               precision == other.precision && scale == other.scale;
    }
    bool operator!=(const SqlTypeDescriptor& other) const { return !(*this == other); }
};

// Longest NVARCHAR(n) before NVARCHAR(MAX) is required
constexpr int kMaxNVarCharLength = 4000;
constexpr int kMinNVarCharLength = 50;
constexpr int kDecimalPrecision = 38;
constexpr int kDecimalScale = 10;

// Never fails: every value maps to some type.
SqlTypeDescriptor infer_sql_type(const SqlValue& value);

} // namespace mssql_mcp::engine
