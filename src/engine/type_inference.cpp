#include "type_inference.hpp"
#include <algorithm>
#include <limits>

namespace mssql_mcp::engine {

SqlTypeDescriptor SqlTypeDescriptor::of(SqlTypeTag tag) {
    SqlTypeDescriptor type;
    type.tag = tag;
    return type;
}

SqlTypeDescriptor SqlTypeDescriptor::decimal(int precision, int scale) {
    SqlTypeDescriptor type;
    type.tag = SqlTypeTag::Decimal;
    type.precision = precision;
    type.scale = scale;
    return type;
}

SqlTypeDescriptor SqlTypeDescriptor::nvarchar(int length) {
    SqlTypeDescriptor type;
    type.tag = SqlTypeTag::NVarChar;
    type.length = length;
    return type;
}

std::string SqlTypeDescriptor::declaration() const {
    switch (tag) {
        case SqlTypeTag::Variant: return "SQL_VARIANT";
        case SqlTypeTag::Int: return "INT";
        case SqlTypeTag::BigInt: return "BIGINT";
        case SqlTypeTag::Decimal:
            return "DECIMAL(" + std::to_string(precision) + "," + std::to_string(scale) + ")";
        case SqlTypeTag::Float: return "FLOAT";
        case SqlTypeTag::Bit: return "BIT";
        case SqlTypeTag::NVarChar:
            if (length == kMaxLength) {
                return "NVARCHAR(MAX)";
            }
            return "NVARCHAR(" + std::to_string(length) + ")";
        case SqlTypeTag::DateTime2: return "DATETIME2";
    }
    return "SQL_VARIANT";
}

SqlTypeDescriptor infer_sql_type(const SqlValue& value) {
    switch (value.kind()) {
        case SqlValueKind::Null:
            return SqlTypeDescriptor::of(SqlTypeTag::Variant);
        case SqlValueKind::Integer: {
            std::int64_t v = value.as_integer();
            bool fits_int32 = v >= std::numeric_limits<std::int32_t>::min() &&
                              v <= std::numeric_limits<std::int32_t>::max();
            return SqlTypeDescriptor::of(fits_int32 ? SqlTypeTag::Int : SqlTypeTag::BigInt);
        }
        case SqlValueKind::Decimal:
            return SqlTypeDescriptor::decimal(kDecimalPrecision, kDecimalScale);
        case SqlValueKind::Float:
            return SqlTypeDescriptor::of(SqlTypeTag::Float);
        case SqlValueKind::Bool:
            return SqlTypeDescriptor::of(SqlTypeTag::Bit);
        case SqlValueKind::Text: {
            std::size_t doubled = utf16_length(value.as_text()) * 2;
            if (doubled > static_cast<std::size_t>(kMaxNVarCharLength)) {
                return SqlTypeDescriptor::nvarchar(SqlTypeDescriptor::kMaxLength);
            }
            return SqlTypeDescriptor::nvarchar(std::max(static_cast<int>(doubled), kMinNVarCharLength));
        }
        case SqlValueKind::Temporal:
            return SqlTypeDescriptor::of(SqlTypeTag::DateTime2);
    }
    return SqlTypeDescriptor::of(SqlTypeTag::Variant);
}

} // namespace mssql_mcp::engine
