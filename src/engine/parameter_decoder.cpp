#include "parameter_decoder.hpp"
#include "errors.hpp"
#include "type_inference.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace mssql_mcp::engine {

namespace {

// Integer digits that DECIMAL(kDecimalPrecision, kDecimalScale) can hold
constexpr int kMaxDecimalIntegerDigits = kDecimalPrecision - kDecimalScale;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

SqlValue classify_integer(std::int64_t value) {
    return SqlValue::integer(value);
}

// Non-integral number token: exact decimal when the spelling fits the
// declared DECIMAL type without rounding, else double
SqlValue classify_fraction(double value, const std::string& spelling) {
    auto decimal = Decimal::parse(spelling);
    if (decimal && decimal->scale() <= kDecimalScale &&
        decimal->precision() - decimal->scale() <= kMaxDecimalIntegerDigits) {
        return SqlValue::decimal(std::move(*decimal));
    }
    return SqlValue::floating(value);
}

SqlValue classify_string(std::string text) {
    if (auto temporal = parse_temporal(text)) {
        return SqlValue::temporal(*temporal);
    }
    return SqlValue::text(std::move(text));
}

// SAX consumer: top-level members become SqlValues, nested containers are
// rebuilt as JSON and stored as their compact text.
class ParameterSaxHandler {
public:
    using json = nlohmann::json;

    bool null() { return scalar(SqlValue::null(), nullptr); }
    bool boolean(bool val) { return scalar(SqlValue::boolean(val), val); }
    bool number_integer(json::number_integer_t val) {
        return scalar(classify_integer(val), val);
    }
    bool number_unsigned(json::number_unsigned_t val) {
        if (val <= static_cast<json::number_unsigned_t>(std::numeric_limits<std::int64_t>::max())) {
            return scalar(classify_integer(static_cast<std::int64_t>(val)), val);
        }
        auto decimal = Decimal::parse(std::to_string(val));
        return scalar(SqlValue::decimal(std::move(*decimal)), val);
    }
    bool number_float(json::number_float_t val, const json::string_t& spelling) {
        return scalar(classify_fraction(val, spelling), val);
    }
    bool string(json::string_t& val) {
        nlohmann::ordered_json raw = val;
        return scalar(classify_string(val), std::move(raw));
    }
    bool binary(json::binary_t&) {
        error_ = "binary values are not supported";
        return false;
    }

    bool start_object(std::size_t) {
        if (depth_ == 0) {
            depth_ = 1;
            return true;
        }
        frames_.push_back({nlohmann::ordered_json::object(), pending_key_});
        ++depth_;
        return true;
    }

    bool end_object() {
        if (depth_ == 1) {
            depth_ = 0;
            return true;
        }
        return close_frame();
    }

    bool start_array(std::size_t) {
        if (depth_ == 0) {
            error_ = "expected a JSON object of parameters, got an array";
            return false;
        }
        frames_.push_back({nlohmann::ordered_json::array(), pending_key_});
        ++depth_;
        return true;
    }

    bool end_array() { return close_frame(); }

    bool key(json::string_t& val) {
        pending_key_ = val;
        return true;
    }

    bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception& ex) {
        error_ = ex.what();
        return false;
    }

    const std::string& error() const { return error_; }
    ParameterMap take() { return std::move(entries_); }

private:
    struct Frame {
        nlohmann::ordered_json value;
        std::string key;
    };

    bool scalar(SqlValue value, nlohmann::ordered_json raw) {
        if (depth_ == 0) {
            if (value.is_null()) {
                return true;  // whole document is null: no parameters
            }
            error_ = std::string("expected a JSON object of parameters, got a ") +
                     kind_to_string(value.kind());
            return false;
        }
        if (depth_ == 1) {
            store(pending_key_, std::move(value));
            return true;
        }
        attach(std::move(raw), pending_key_);
        return true;
    }

    bool close_frame() {
        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        --depth_;
        if (depth_ == 1) {
            store(frame.key, SqlValue::text(frame.value.dump()));
        } else {
            attach(std::move(frame.value), frame.key);
        }
        return true;
    }

    void attach(nlohmann::ordered_json value, const std::string& key) {
        auto& parent = frames_.back().value;
        if (parent.is_object()) {
            parent[key] = std::move(value);
        } else {
            parent.push_back(std::move(value));
        }
    }

    void store(const std::string& key, SqlValue value) {
        auto existing = std::find_if(entries_.begin(), entries_.end(),
            [&](const ParameterEntry& e) { return e.first == key; });
        if (existing != entries_.end()) {
            LOG_DEBUG("Duplicate parameter '" + key + "', keeping last value");
            existing->second = std::move(value);
            return;
        }
        entries_.emplace_back(key, std::move(value));
    }

    int depth_ = 0;
    std::string pending_key_;
    std::vector<Frame> frames_;
    ParameterMap entries_;
    std::string error_;
};

} // anonymous namespace

ParameterShape classify_parameter_text(std::string_view text) {
    std::string_view trimmed = trim(text);
    if (trimmed.empty() || trimmed == "null") {
        return ParameterShape::Empty;
    }
    return trimmed.front() == '{' ? ParameterShape::JsonMap : ParameterShape::LiteralList;
}

ParameterMap decode_parameters(std::string_view text) {
    std::string_view trimmed = trim(text);
    if (trimmed.empty()) {
        return {};
    }

    std::string input(trimmed);
    ParameterSaxHandler handler;
    bool ok = nlohmann::json::sax_parse(input, &handler);
    if (!ok) {
        throw MalformedParameters(handler.error().empty() ? "unexpected input" : handler.error());
    }

    ParameterMap entries = handler.take();
    LOG_TRACE("Decoded " + std::to_string(entries.size()) + " parameter(s)");
    return entries;
}

} // namespace mssql_mcp::engine
