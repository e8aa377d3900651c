#include "sql_value.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <locale>
#include <regex>
#include <sstream>

namespace mssql_mcp::engine {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

// Fraction digits ("5", "1234567", up to 9) to nanoseconds
std::uint32_t fraction_to_ns(const std::string& digits) {
    std::string padded = digits;
    padded.resize(9, '0');
    return static_cast<std::uint32_t>(std::stoul(padded));
}

void append_time(std::ostringstream& oss, const Temporal& t) {
    oss << std::setfill('0') << std::setw(2) << t.hour << ':'
        << std::setw(2) << t.minute << ':' << std::setw(2) << t.second;
    if (t.fraction_ns == 0) {
        return;
    }
    std::ostringstream frac;
    frac << std::setfill('0') << std::setw(9) << t.fraction_ns;
    std::string digits = frac.str();
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
    }
    oss << '.' << digits;
}

bool valid_time(unsigned hour, unsigned minute, unsigned second) {
    return hour < 24 && minute < 60 && second < 60;
}

} // anonymous namespace

// ── Decimal ──────────────────────────────────────────────────

std::optional<Decimal> Decimal::parse(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) {
        return std::nullopt;
    }

    bool negative = false;
    if (text[begin] == '+' || text[begin] == '-') {
        negative = text[begin] == '-';
        ++begin;
    }

    std::string integer_part;
    std::string fraction_part;
    bool seen_point = false;
    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c == '.') {
            if (seen_point) return std::nullopt;
            seen_point = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            (seen_point ? fraction_part : integer_part).push_back(c);
        } else {
            return std::nullopt;
        }
    }
    if (integer_part.empty() && fraction_part.empty()) {
        return std::nullopt;
    }

    size_t first_nonzero = integer_part.find_first_not_of('0');
    integer_part = first_nonzero == std::string::npos ? "0" : integer_part.substr(first_nonzero);

    bool is_zero = integer_part == "0" &&
                   fraction_part.find_first_not_of('0') == std::string::npos;

    std::string canonical;
    if (negative && !is_zero) {
        canonical.push_back('-');
    }
    canonical += integer_part;
    if (!fraction_part.empty()) {
        canonical.push_back('.');
        canonical += fraction_part;
    }
    return Decimal(std::move(canonical));
}

int Decimal::scale() const noexcept {
    size_t point = text_.find('.');
    return point == std::string::npos ? 0 : static_cast<int>(text_.size() - point - 1);
}

int Decimal::precision() const noexcept {
    size_t start = is_negative() ? 1 : 0;
    size_t point = text_.find('.');
    size_t integer_digits = (point == std::string::npos ? text_.size() : point) - start;
    if (integer_digits == 1 && text_[start] == '0') {
        integer_digits = 0;
    }
    int digits = static_cast<int>(integer_digits) + scale();
    return digits == 0 ? 1 : digits;
}

// ── Temporal ─────────────────────────────────────────────────

std::string Temporal::to_iso_string() const {
    std::ostringstream oss;
    if (kind != TemporalKind::Time) {
        oss << std::setfill('0') << std::setw(4) << year << '-'
            << std::setw(2) << month << '-' << std::setw(2) << day;
    }
    if (kind == TemporalKind::DateTime) {
        oss << 'T';
    }
    if (kind != TemporalKind::Date) {
        append_time(oss, *this);
    }
    return oss.str();
}

bool Temporal::operator==(const Temporal& other) const {
    return kind == other.kind && year == other.year && month == other.month &&
           day == other.day && hour == other.hour && minute == other.minute &&
           second == other.second && fraction_ns == other.fraction_ns;
}

std::optional<Temporal> parse_temporal(std::string_view text) {
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,7}))?)?)?$)");

    std::string input(text);
    std::smatch match;
    if (!std::regex_match(input, match, pattern)) {
        return std::nullopt;
    }

    Temporal t;
    t.year = std::stoi(match[1].str());
    t.month = static_cast<unsigned>(std::stoul(match[2].str()));
    t.day = static_cast<unsigned>(std::stoul(match[3].str()));
    if (t.year < 1 || t.month < 1 || t.month > 12 || t.day < 1 || t.day > days_in_month(t.year, t.month)) {
        return std::nullopt;
    }

    if (!match[4].matched) {
        t.kind = TemporalKind::Date;
        return t;
    }

    t.kind = TemporalKind::DateTime;
    t.hour = static_cast<unsigned>(std::stoul(match[4].str()));
    t.minute = static_cast<unsigned>(std::stoul(match[5].str()));
    t.second = match[6].matched ? static_cast<unsigned>(std::stoul(match[6].str())) : 0;
    t.fraction_ns = match[7].matched ? fraction_to_ns(match[7].str()) : 0;
    if (!valid_time(t.hour, t.minute, t.second)) {
        return std::nullopt;
    }
    return t;
}

std::optional<Temporal> parse_time_of_day(std::string_view text) {
    static const std::regex pattern(R"(^(\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?$)");

    std::string input(text);
    std::smatch match;
    if (!std::regex_match(input, match, pattern)) {
        return std::nullopt;
    }

    Temporal t;
    t.kind = TemporalKind::Time;
    t.hour = static_cast<unsigned>(std::stoul(match[1].str()));
    t.minute = static_cast<unsigned>(std::stoul(match[2].str()));
    t.second = match[3].matched ? static_cast<unsigned>(std::stoul(match[3].str())) : 0;
    t.fraction_ns = match[4].matched ? fraction_to_ns(match[4].str()) : 0;
    if (!valid_time(t.hour, t.minute, t.second)) {
        return std::nullopt;
    }
    return t;
}

// ── SqlValue ─────────────────────────────────────────────────

const char* kind_to_string(SqlValueKind kind) {
    switch (kind) {
        case SqlValueKind::Null: return "Null";
        case SqlValueKind::Integer: return "Integer";
        case SqlValueKind::Decimal: return "Decimal";
        case SqlValueKind::Float: return "Float";
        case SqlValueKind::Bool: return "Bool";
        case SqlValueKind::Text: return "Text";
        case SqlValueKind::Temporal: return "Temporal";
        default: return "Unknown";
    }
}

std::string SqlValue::to_sql_text() const {
    switch (kind()) {
        case SqlValueKind::Null:
            return "";
        case SqlValueKind::Integer:
            return std::to_string(as_integer());
        case SqlValueKind::Decimal:
            return as_decimal().text();
        case SqlValueKind::Float: {
            std::ostringstream oss;
            oss.imbue(std::locale::classic());
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << as_float();
            return oss.str();
        }
        case SqlValueKind::Bool:
            return as_bool() ? "1" : "0";
        case SqlValueKind::Text:
            return as_text();
        case SqlValueKind::Temporal: {
            // ODBC timestamp literal form uses a space between date and time
            std::string text = as_temporal().to_iso_string();
            std::replace(text.begin(), text.end(), 'T', ' ');
            return text;
        }
    }
    return "";
}

nlohmann::ordered_json to_json(const SqlValue& value) {
    switch (value.kind()) {
        case SqlValueKind::Null:
            return nullptr;
        case SqlValueKind::Integer:
            return value.as_integer();
        case SqlValueKind::Decimal: {
            const Decimal& d = value.as_decimal();
            if (d.scale() == 0 && d.precision() <= 18) {
                return std::stoll(d.text());
            }
            // Canonical decimal text is valid JSON number syntax
            return nlohmann::ordered_json::parse(d.text());
        }
        case SqlValueKind::Float:
            return value.as_float();
        case SqlValueKind::Bool:
            return value.as_bool();
        case SqlValueKind::Text:
            return value.as_text();
        case SqlValueKind::Temporal:
            return value.as_temporal().to_iso_string();
    }
    return nullptr;
}

std::size_t utf16_length(std::string_view utf8) {
    std::size_t units = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) == 0x80) {
            continue;  // continuation byte
        }
        units += (c >= 0xF0) ? 2 : 1;
    }
    return units;
}

} // namespace mssql_mcp::engine
