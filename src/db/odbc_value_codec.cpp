#include "odbc_value_codec.hpp"
#include "core/logger.hpp"
#include "core/sqlwchar_utils.hpp"
#include "engine/errors.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <locale>
#include <sstream>

namespace mssql_mcp::db {

using engine::ParameterDirection;
using engine::SqlTypeDescriptor;
using engine::SqlTypeTag;
using engine::SqlValue;
using engine::SqlValueKind;

namespace {

constexpr std::size_t kChunkUnits = 4096;
constexpr std::size_t kNarrowOutputBytes = 128;
constexpr std::size_t kVariantOutputBytes = 8001;
// NVARCHAR(MAX) output buffers; longer values are reported, not truncated
constexpr std::size_t kLongOutputUnits = 1024 * 1024;
// SQL_SS_LENGTH_UNLIMITED: column size that binds a (MAX) parameter
constexpr SQLULEN kUnlimitedLength = 0;

template <typename T>
void store_fixed(ParameterBuffer& buffer, const T& value) {
    buffer.storage.resize(sizeof(T));
    std::memcpy(buffer.storage.data(), &value, sizeof(T));
    buffer.indicator = sizeof(T);
}

template <typename T>
T load_fixed(const ParameterBuffer& buffer) {
    T value{};
    std::memcpy(&value, buffer.storage.data(), std::min(sizeof(T), buffer.storage.size()));
    return value;
}

// Wide text with room for `capacity_units` characters plus the terminator
void store_wide(ParameterBuffer& buffer, std::string_view text, std::size_t capacity_units) {
    std::vector<SQLWCHAR> wide = core::to_sqlwchar(text);
    std::size_t units = wide.size() - 1;
    std::size_t bytes = std::max(units, capacity_units) * sizeof(SQLWCHAR) + sizeof(SQLWCHAR);
    buffer.storage.assign(bytes, 0);
    std::memcpy(buffer.storage.data(), wide.data(), wide.size() * sizeof(SQLWCHAR));
    buffer.indicator = static_cast<SQLLEN>(units * sizeof(SQLWCHAR));
}

void store_narrow(ParameterBuffer& buffer, const std::string& text, std::size_t capacity_bytes) {
    buffer.storage.assign(std::max(text.size() + 1, capacity_bytes), 0);
    std::memcpy(buffer.storage.data(), text.data(), text.size());
    buffer.indicator = SQL_NTS;
}

SQL_TIMESTAMP_STRUCT to_timestamp_struct(const engine::Temporal& t) {
    SQL_TIMESTAMP_STRUCT ts{};
    ts.year = static_cast<SQLSMALLINT>(t.year);
    ts.month = static_cast<SQLUSMALLINT>(t.month);
    ts.day = static_cast<SQLUSMALLINT>(t.day);
    ts.hour = static_cast<SQLUSMALLINT>(t.hour);
    ts.minute = static_cast<SQLUSMALLINT>(t.minute);
    ts.second = static_cast<SQLUSMALLINT>(t.second);
    // DATETIME2 keeps 100ns ticks
    ts.fraction = t.fraction_ns - t.fraction_ns % 100;
    return ts;
}

void bind_input(ParameterBuffer& buffer, const SqlValue& value) {
    switch (value.kind()) {
        case SqlValueKind::Null:
            buffer.c_type = SQL_C_CHAR;
            buffer.sql_type = SQL_VARCHAR;
            buffer.column_size = 1;
            buffer.storage.assign(1, 0);
            buffer.indicator = SQL_NULL_DATA;
            break;
        case SqlValueKind::Integer:
            buffer.c_type = SQL_C_SBIGINT;
            buffer.sql_type = SQL_BIGINT;
            buffer.column_size = 19;
            store_fixed<SQLBIGINT>(buffer, value.as_integer());
            break;
        case SqlValueKind::Decimal: {
            const engine::Decimal& d = value.as_decimal();
            buffer.c_type = SQL_C_CHAR;
            buffer.sql_type = SQL_DECIMAL;
            buffer.column_size = engine::kDecimalPrecision;
            buffer.decimal_digits = static_cast<SQLSMALLINT>(std::min(d.scale(), engine::kDecimalPrecision));
            store_narrow(buffer, d.text(), 0);
            break;
        }
        case SqlValueKind::Float:
            buffer.c_type = SQL_C_DOUBLE;
            buffer.sql_type = SQL_DOUBLE;
            buffer.column_size = 15;
            store_fixed<SQLDOUBLE>(buffer, value.as_float());
            break;
        case SqlValueKind::Bool:
            buffer.c_type = SQL_C_BIT;
            buffer.sql_type = SQL_BIT;
            buffer.column_size = 1;
            store_fixed<SQLCHAR>(buffer, value.as_bool() ? 1 : 0);
            break;
        case SqlValueKind::Text: {
            std::size_t units = engine::utf16_length(value.as_text());
            bool long_text = units > static_cast<std::size_t>(engine::kMaxNVarCharLength);
            buffer.c_type = SQL_C_WCHAR;
            buffer.sql_type = long_text ? SQL_WLONGVARCHAR : SQL_WVARCHAR;
            buffer.column_size = std::max<std::size_t>(units, 1);
            store_wide(buffer, value.as_text(), 0);
            break;
        }
        case SqlValueKind::Temporal:
            buffer.c_type = SQL_C_TYPE_TIMESTAMP;
            buffer.sql_type = SQL_TYPE_TIMESTAMP;
            buffer.column_size = 27;
            buffer.decimal_digits = 7;
            store_fixed(buffer, to_timestamp_struct(value.as_temporal()));
            break;
    }
}

// Output and input/output parameters travel as text of the declared type;
// the driver converts in both directions.
void bind_declared(ParameterBuffer& buffer, const SqlValue& value, const SqlTypeDescriptor& type) {
    std::string text = value.to_sql_text();
    switch (type.tag) {
        case SqlTypeTag::Int:
            buffer.sql_type = SQL_INTEGER;
            buffer.column_size = 10;
            break;
        case SqlTypeTag::BigInt:
            buffer.sql_type = SQL_BIGINT;
            buffer.column_size = 19;
            break;
        case SqlTypeTag::Decimal:
            buffer.sql_type = SQL_DECIMAL;
            buffer.column_size = type.precision;
            buffer.decimal_digits = static_cast<SQLSMALLINT>(type.scale);
            break;
        case SqlTypeTag::Float:
            buffer.sql_type = SQL_DOUBLE;
            buffer.column_size = 15;
            break;
        case SqlTypeTag::Bit:
            buffer.sql_type = SQL_BIT;
            buffer.column_size = 1;
            break;
        case SqlTypeTag::DateTime2:
            buffer.sql_type = SQL_TYPE_TIMESTAMP;
            buffer.column_size = 27;
            buffer.decimal_digits = 7;
            break;
        case SqlTypeTag::NVarChar: {
            bool is_max = type.length == SqlTypeDescriptor::kMaxLength;
            std::size_t capacity = is_max ? kLongOutputUnits : static_cast<std::size_t>(type.length);
            buffer.c_type = SQL_C_WCHAR;
            buffer.sql_type = SQL_WVARCHAR;
            buffer.column_size = is_max ? kUnlimitedLength : std::max<std::size_t>(capacity, 1);
            store_wide(buffer, text, capacity);
            if (value.is_null()) {
                buffer.indicator = SQL_NULL_DATA;
            }
            return;
        }
        case SqlTypeTag::Variant:
            buffer.sql_type = SQL_VARCHAR;
            buffer.column_size = kVariantOutputBytes - 1;
            break;
    }

    buffer.c_type = SQL_C_CHAR;
    std::size_t capacity = type.tag == SqlTypeTag::Variant ? kVariantOutputBytes : kNarrowOutputBytes;
    store_narrow(buffer, text, capacity);
    if (value.is_null()) {
        buffer.indicator = SQL_NULL_DATA;
    }
}

SqlValue value_from_text(SqlTypeTag tag, const std::string& text) {
    switch (tag) {
        case SqlTypeTag::Int:
        case SqlTypeTag::BigInt:
            return SqlValue::integer(std::stoll(text));
        case SqlTypeTag::Decimal:
            if (auto d = engine::Decimal::parse(text)) {
                return SqlValue::decimal(*d);
            }
            break;
        case SqlTypeTag::Float: {
            // The driver writes large and small doubles in exponent form
            std::istringstream in(text);
            in.imbue(std::locale::classic());
            double value = 0;
            if (in >> value && (in >> std::ws).eof()) {
                return SqlValue::floating(value);
            }
            break;
        }
        case SqlTypeTag::Bit:
            return SqlValue::boolean(text == "1");
        case SqlTypeTag::DateTime2:
            if (auto t = engine::parse_temporal(text)) {
                return SqlValue::temporal(*t);
            }
            break;
        default:
            break;
    }
    return SqlValue::text(text);
}

// Reads all chunks of a character column; nullopt for NULL
std::optional<std::string> read_wide_text(core::OdbcStatement& stmt, SQLUSMALLINT column) {
    std::vector<SQLWCHAR> chunk(kChunkUnits);
    std::vector<SQLWCHAR> all;
    while (true) {
        SQLLEN indicator = 0;
        SQLRETURN ret = stmt.get_data(column, SQL_C_WCHAR, chunk.data(),
                                      static_cast<SQLLEN>(chunk.size() * sizeof(SQLWCHAR)), &indicator);
        if (ret == SQL_NO_DATA) {
            break;
        }
        if (indicator == SQL_NULL_DATA) {
            return std::nullopt;
        }
        std::size_t units = chunk.size() - 1;
        if (indicator != SQL_NO_TOTAL) {
            units = std::min(units, static_cast<std::size_t>(indicator) / sizeof(SQLWCHAR));
        }
        all.insert(all.end(), chunk.begin(), chunk.begin() + units);
        if (ret == SQL_SUCCESS) {
            break;
        }
    }
    return core::from_sqlwchar(all.data(), all.size());
}

std::optional<std::string> read_binary_hex(core::OdbcStatement& stmt, SQLUSMALLINT column) {
    std::vector<unsigned char> chunk(kChunkUnits);
    std::ostringstream hex;
    hex << "0x" << std::uppercase << std::hex << std::setfill('0');
    while (true) {
        SQLLEN indicator = 0;
        SQLRETURN ret = stmt.get_data(column, SQL_C_BINARY, chunk.data(),
                                      static_cast<SQLLEN>(chunk.size()), &indicator);
        if (ret == SQL_NO_DATA) {
            break;
        }
        if (indicator == SQL_NULL_DATA) {
            return std::nullopt;
        }
        std::size_t bytes = chunk.size();
        if (indicator != SQL_NO_TOTAL) {
            bytes = std::min(bytes, static_cast<std::size_t>(indicator));
        }
        for (std::size_t i = 0; i < bytes; ++i) {
            hex << std::setw(2) << static_cast<int>(chunk[i]);
        }
        if (ret == SQL_SUCCESS) {
            break;
        }
    }
    return hex.str();
}

std::optional<std::string> read_narrow_text(core::OdbcStatement& stmt, SQLUSMALLINT column) {
    char buffer[128] = {0};
    SQLLEN indicator = 0;
    SQLRETURN ret = stmt.get_data(column, SQL_C_CHAR, buffer, sizeof(buffer), &indicator);
    if (ret == SQL_NO_DATA || indicator == SQL_NULL_DATA) {
        return std::nullopt;
    }
    return std::string(buffer);
}

template <typename T>
std::optional<T> read_fixed(core::OdbcStatement& stmt, SQLUSMALLINT column, SQLSMALLINT c_type) {
    T value{};
    SQLLEN indicator = 0;
    SQLRETURN ret = stmt.get_data(column, c_type, &value, sizeof(T), &indicator);
    if (ret == SQL_NO_DATA || indicator == SQL_NULL_DATA) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

ParameterBuffer make_parameter_buffer(const engine::BindParameter& parameter) {
    ParameterBuffer buffer;
    switch (parameter.direction) {
        case ParameterDirection::Input:
            buffer.io_type = SQL_PARAM_INPUT;
            bind_input(buffer, parameter.value);
            break;
        case ParameterDirection::ReturnValue:
            buffer.io_type = SQL_PARAM_OUTPUT;
            buffer.c_type = SQL_C_SLONG;
            buffer.sql_type = SQL_INTEGER;
            buffer.column_size = 10;
            store_fixed<SQLINTEGER>(buffer, 0);
            break;
        case ParameterDirection::InputOutput:
        case ParameterDirection::Output: {
            buffer.io_type = parameter.direction == ParameterDirection::Output
                ? SQL_PARAM_OUTPUT : SQL_PARAM_INPUT_OUTPUT;
            SqlTypeDescriptor type = parameter.declared_type
                ? *parameter.declared_type : engine::infer_sql_type(parameter.value);
            bind_declared(buffer, parameter.value, type);
            break;
        }
    }
    return buffer;
}

SqlValue read_parameter_value(const ParameterBuffer& buffer, const engine::BindParameter& parameter) {
    if (buffer.indicator == SQL_NULL_DATA) {
        return SqlValue::null();
    }
    if (buffer.c_type == SQL_C_SLONG) {
        return SqlValue::integer(load_fixed<SQLINTEGER>(buffer));
    }
    if (buffer.c_type == SQL_C_WCHAR) {
        std::size_t capacity = buffer.storage.size() / sizeof(SQLWCHAR) - 1;
        std::size_t units = capacity;
        if (buffer.indicator != SQL_NO_TOTAL && buffer.indicator != SQL_NTS) {
            units = static_cast<std::size_t>(buffer.indicator) / sizeof(SQLWCHAR);
            if (units > capacity) {
                throw engine::ExecutionFailure("Output parameter " + parameter.name + " returned " +
                                               std::to_string(units) + " characters, more than the " +
                                               std::to_string(capacity) + " it can hold");
            }
        }
        const auto* wide = reinterpret_cast<const SQLWCHAR*>(buffer.storage.data());
        return SqlValue::text(core::from_sqlwchar(wide, units));
    }

    if (buffer.indicator >= 0 && static_cast<std::size_t>(buffer.indicator) >= buffer.storage.size()) {
        throw engine::ExecutionFailure("Output parameter " + parameter.name + " returned " +
                                       std::to_string(buffer.indicator) + " bytes, more than the " +
                                       std::to_string(buffer.storage.size() - 1) + " it can hold");
    }
    const char* narrow = reinterpret_cast<const char*>(buffer.storage.data());
    std::string text(narrow, std::find(narrow, narrow + buffer.storage.size(), '\0'));
    SqlTypeTag tag = parameter.declared_type ? parameter.declared_type->tag
                                             : engine::infer_sql_type(parameter.value).tag;
    return value_from_text(tag, text);
}

SqlValue read_column(core::OdbcStatement& stmt, SQLUSMALLINT column,
                     const core::ColumnDescription& description) {
    switch (description.sql_type) {
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT: {
            auto v = read_fixed<SQLBIGINT>(stmt, column, SQL_C_SBIGINT);
            return v ? SqlValue::integer(*v) : SqlValue::null();
        }
        case SQL_BIT: {
            auto v = read_fixed<SQLCHAR>(stmt, column, SQL_C_BIT);
            return v ? SqlValue::boolean(*v != 0) : SqlValue::null();
        }
        case SQL_DECIMAL:
        case SQL_NUMERIC: {
            auto text = read_narrow_text(stmt, column);
            if (!text) {
                return SqlValue::null();
            }
            auto d = engine::Decimal::parse(*text);
            return d ? SqlValue::decimal(*d) : SqlValue::text(*text);
        }
        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE: {
            auto v = read_fixed<SQLDOUBLE>(stmt, column, SQL_C_DOUBLE);
            return v ? SqlValue::floating(*v) : SqlValue::null();
        }
        case SQL_TYPE_DATE: {
            auto v = read_fixed<SQL_DATE_STRUCT>(stmt, column, SQL_C_TYPE_DATE);
            if (!v) {
                return SqlValue::null();
            }
            engine::Temporal t;
            t.kind = engine::TemporalKind::Date;
            t.year = v->year;
            t.month = v->month;
            t.day = v->day;
            return SqlValue::temporal(t);
        }
        case SQL_TYPE_TIMESTAMP: {
            auto v = read_fixed<SQL_TIMESTAMP_STRUCT>(stmt, column, SQL_C_TYPE_TIMESTAMP);
            if (!v) {
                return SqlValue::null();
            }
            engine::Temporal t;
            t.kind = engine::TemporalKind::DateTime;
            t.year = v->year;
            t.month = v->month;
            t.day = v->day;
            t.hour = v->hour;
            t.minute = v->minute;
            t.second = v->second;
            t.fraction_ns = v->fraction;
            return SqlValue::temporal(t);
        }
        case SQL_TYPE_TIME:
        case kSsTime2: {
            auto text = read_narrow_text(stmt, column);
            if (!text) {
                return SqlValue::null();
            }
            auto t = engine::parse_time_of_day(*text);
            return t ? SqlValue::temporal(*t) : SqlValue::text(*text);
        }
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY: {
            auto hex = read_binary_hex(stmt, column);
            return hex ? SqlValue::text(*hex) : SqlValue::null();
        }
        default: {
            // Character data, GUIDs, XML, DATETIMEOFFSET, SQL_VARIANT
            auto text = read_wide_text(stmt, column);
            return text ? SqlValue::text(*text) : SqlValue::null();
        }
    }
}

SqlTypeDescriptor describe_odbc_type(SQLSMALLINT data_type, SQLINTEGER column_size,
                                     SQLSMALLINT decimal_digits) {
    switch (data_type) {
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
            return SqlTypeDescriptor::of(SqlTypeTag::Int);
        case SQL_BIGINT:
            return SqlTypeDescriptor::of(SqlTypeTag::BigInt);
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            return SqlTypeDescriptor::decimal(column_size > 0 ? column_size : engine::kDecimalPrecision,
                                              decimal_digits);
        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return SqlTypeDescriptor::of(SqlTypeTag::Float);
        case SQL_BIT:
            return SqlTypeDescriptor::of(SqlTypeTag::Bit);
        case SQL_TYPE_DATE:
        case SQL_TYPE_TIME:
        case SQL_TYPE_TIMESTAMP:
        case kSsTime2:
            return SqlTypeDescriptor::of(SqlTypeTag::DateTime2);
        case SQL_CHAR:
        case SQL_VARCHAR:
        case SQL_LONGVARCHAR:
        case SQL_WCHAR:
        case SQL_WVARCHAR:
        case SQL_WLONGVARCHAR:
            if (column_size <= 0 || column_size > engine::kMaxNVarCharLength) {
                return SqlTypeDescriptor::nvarchar(SqlTypeDescriptor::kMaxLength);
            }
            return SqlTypeDescriptor::nvarchar(column_size);
        default:
            LOG_DEBUG("No declarable mapping for ODBC type " + std::to_string(data_type) +
                      ", using SQL_VARIANT");
            return SqlTypeDescriptor::of(SqlTypeTag::Variant);
    }
}

} // namespace mssql_mcp::db
