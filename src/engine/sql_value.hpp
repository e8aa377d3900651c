#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

namespace mssql_mcp::engine {

// Exact fixed-point number kept as canonical text: optional '-', at least one
// integer digit, optional '.' followed by the fraction digits.
class Decimal {
public:
    // Accepts driver and JSON spellings ("+1.50", ".5", "-000.10", "12");
    // std::nullopt when the text is not a plain decimal number.
    static std::optional<Decimal> parse(std::string_view text);

    const std::string& text() const noexcept { return text_; }
    int precision() const noexcept;
    int scale() const noexcept;
    bool is_negative() const noexcept { return !text_.empty() && text_[0] == '-'; }

    bool operator==(const Decimal& other) const { return text_ == other.text_; }
    bool operator!=(const Decimal& other) const { return !(*this == other); }

private:
    explicit Decimal(std::string text) : text_(std::move(text)) {}
    std::string text_;
};

enum class TemporalKind { Date, Time, DateTime };

struct Temporal {
    TemporalKind kind = TemporalKind::DateTime;
    int year = 1900;
    unsigned month = 1;
    unsigned day = 1;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    std::uint32_t fraction_ns = 0;

    // "2024-01-31", "10:15:00.5", "2024-01-31T10:15:00.1234567"
    std::string to_iso_string() const;

    bool operator==(const Temporal& other) const;
    bool operator!=(const Temporal& other) const { return !(*this == other); }
};

// Parses ISO-8601 local dates and date-times ("YYYY-MM-DD",
// "YYYY-MM-DD[T ]hh:mm[:ss[.fffffff]]") with calendar validation.
std::optional<Temporal> parse_temporal(std::string_view text);

// Parses "hh:mm[:ss[.fffffff]]".
std::optional<Temporal> parse_time_of_day(std::string_view text);

enum class SqlValueKind { Null, Integer, Decimal, Float, Bool, Text, Temporal };

const char* kind_to_string(SqlValueKind kind);

// Closed tagged value shared by decoded parameters, bind variables and
// materialized result cells.
class SqlValue {
public:
    using Storage = std::variant<std::monostate, std::int64_t, Decimal, double, bool, std::string, Temporal>;

    SqlValue() = default;

    static SqlValue null() { return SqlValue(); }
    static SqlValue integer(std::int64_t value) { return SqlValue(Storage(std::in_place_index<1>, value)); }
    static SqlValue decimal(Decimal value) { return SqlValue(Storage(std::in_place_index<2>, std::move(value))); }
    static SqlValue floating(double value) { return SqlValue(Storage(std::in_place_index<3>, value)); }
    static SqlValue boolean(bool value) { return SqlValue(Storage(std::in_place_index<4>, value)); }
    static SqlValue text(std::string value) { return SqlValue(Storage(std::in_place_index<5>, std::move(value))); }
    static SqlValue temporal(Temporal value) { return SqlValue(Storage(std::in_place_index<6>, std::move(value))); }

    SqlValueKind kind() const noexcept { return static_cast<SqlValueKind>(storage_.index()); }
    bool is_null() const noexcept { return kind() == SqlValueKind::Null; }

    std::int64_t as_integer() const { return std::get<1>(storage_); }
    const Decimal& as_decimal() const { return std::get<2>(storage_); }
    double as_float() const { return std::get<3>(storage_); }
    bool as_bool() const { return std::get<4>(storage_); }
    const std::string& as_text() const { return std::get<5>(storage_); }
    const Temporal& as_temporal() const { return std::get<6>(storage_); }

    const Storage& storage() const noexcept { return storage_; }

    // Text the database accepts when converting from a character type
    // ("1"/"0" for Bool, "YYYY-MM-DD hh:mm:ss[.f]" for Temporal). Empty for Null.
    std::string to_sql_text() const;

    bool operator==(const SqlValue& other) const { return storage_ == other.storage_; }
    bool operator!=(const SqlValue& other) const { return !(*this == other); }

private:
    explicit SqlValue(Storage storage) : storage_(std::move(storage)) {}
    Storage storage_;
};

// JSON rendering keeps the semantic type: numbers stay numbers, Temporal
// becomes an ISO-8601 string, Null becomes null.
nlohmann::ordered_json to_json(const SqlValue& value);

// Number of UTF-16 code units needed for a UTF-8 string.
std::size_t utf16_length(std::string_view utf8);

} // namespace mssql_mcp::engine
