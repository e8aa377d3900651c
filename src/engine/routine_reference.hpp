#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mssql_mcp::engine {

// Wraps an identifier in brackets, doubling any closing bracket inside it.
std::string quote_identifier(std::string_view identifier);

// A callable database object: "[schema.]name".
struct RoutineReference {
    std::optional<std::string> schema;
    std::string name;

    // Splits on '.': first segment schema, second name. Segments past the
    // second are ignored (logged). Throws std::invalid_argument when the
    // name is empty.
    static RoutineReference parse(std::string_view text);

    RoutineReference with_default_schema(const std::string& schema_name) const;

    // "[schema].[name]" or "[name]"
    std::string quoted() const;
    // "schema.name" or "name"
    std::string display() const;
};

} // namespace mssql_mcp::engine
