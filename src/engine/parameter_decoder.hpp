#pragma once

#include "sql_value.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mssql_mcp::engine {

// Decoded parameter map in document order. A key repeated in the document
// keeps its first position and its last value.
using ParameterEntry = std::pair<std::string, SqlValue>;
using ParameterMap = std::vector<ParameterEntry>;

// How a function's parameter text is to be interpreted
enum class ParameterShape {
    Empty,        // absent, blank or the literal null document
    JsonMap,      // a JSON object of name -> value
    LiteralList   // comma-separated SQL literal expressions, spliced as-is
};

ParameterShape classify_parameter_text(std::string_view text);

// Decodes a JSON object into typed values. Blank text and a top-level null
// yield an empty map; anything else that is not an object, or is not valid
// JSON, throws MalformedParameters.
ParameterMap decode_parameters(std::string_view text);

} // namespace mssql_mcp::engine
