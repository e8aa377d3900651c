#include "routine_reference.hpp"
#include "core/logger.hpp"
#include <stdexcept>
#include <vector>

namespace mssql_mcp::engine {

std::string quote_identifier(std::string_view identifier) {
    std::string quoted;
    quoted.reserve(identifier.size() + 2);
    quoted.push_back('[');
    for (char c : identifier) {
        quoted.push_back(c);
        if (c == ']') {
            quoted.push_back(']');
        }
    }
    quoted.push_back(']');
    return quoted;
}

RoutineReference RoutineReference::parse(std::string_view text) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = text.find('.', start);
        segments.emplace_back(text.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }

    RoutineReference ref;
    if (segments.size() == 1) {
        ref.name = segments[0];
    } else {
        ref.schema = segments[0];
        ref.name = segments[1];
        if (segments.size() > 2) {
            LOG_WARN("Routine name '" + std::string(text) + "' has more than two parts, using '" +
                     segments[0] + "." + segments[1] + "'");
        }
    }

    if (ref.name.empty()) {
        throw std::invalid_argument("Routine name '" + std::string(text) + "' is empty");
    }
    if (ref.schema && ref.schema->empty()) {
        ref.schema.reset();
    }
    return ref;
}

RoutineReference RoutineReference::with_default_schema(const std::string& schema_name) const {
    RoutineReference ref = *this;
    if (!ref.schema) {
        ref.schema = schema_name;
    }
    return ref;
}

std::string RoutineReference::quoted() const {
    if (schema) {
        return quote_identifier(*schema) + "." + quote_identifier(name);
    }
    return quote_identifier(name);
}

std::string RoutineReference::display() const {
    return schema ? *schema + "." + name : name;
}

} // namespace mssql_mcp::engine
