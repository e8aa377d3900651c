#include "odbc_connection_provider.hpp"
#include "odbc_session.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "engine/errors.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace mssql_mcp::db {

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Splits "k=v;k={v;v};..." into its attributes, keeping braces intact
std::vector<std::string> split_attributes(const std::string& connection_string) {
    std::vector<std::string> attributes;
    std::string current;
    bool in_braces = false;
    for (size_t i = 0; i < connection_string.size(); ++i) {
        char c = connection_string[i];
        if (in_braces) {
            current.push_back(c);
            if (c == '}') {
                // "}}" is an escaped brace inside a braced value
                if (i + 1 < connection_string.size() && connection_string[i + 1] == '}') {
                    current.push_back('}');
                    ++i;
                } else {
                    in_braces = false;
                }
            }
        } else if (c == '{') {
            in_braces = true;
            current.push_back(c);
        } else if (c == ';') {
            if (!trim(current).empty()) {
                attributes.push_back(current);
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!trim(current).empty()) {
        attributes.push_back(current);
    }
    return attributes;
}

std::string quote_value(const std::string& value) {
    if (value.find_first_of(";{}") == std::string::npos) {
        return value;
    }
    std::string quoted = "{";
    for (char c : value) {
        quoted.push_back(c);
        if (c == '}') {
            quoted.push_back('}');
        }
    }
    quoted.push_back('}');
    return quoted;
}

} // anonymous namespace

OdbcConnectionProvider::OdbcConnectionProvider(std::string connection_string, ConnectionOptions options)
    : connection_string_(std::move(connection_string)),
      options_(options),
      env_(options.pooling) {
}

std::unique_ptr<engine::Session> OdbcConnectionProvider::acquire() {
    return open(connection_string_);
}

std::unique_ptr<engine::Session> OdbcConnectionProvider::acquire(const std::string& database) {
    LOG_DEBUG("Acquiring connection to database " + database);
    return open(with_database(connection_string_, database));
}

std::unique_ptr<engine::Session> OdbcConnectionProvider::open(const std::string& connection_string) {
    try {
        return std::make_unique<OdbcSession>(env_, connection_string, options_.login_timeout);
    } catch (const core::OdbcError& e) {
        LOG_DEBUG(e.format_diagnostics());
        throw engine::ExecutionFailure(e.what(), e.sqlstate());
    }
}

std::string OdbcConnectionProvider::with_database(const std::string& connection_string,
                                                  const std::string& database) {
    std::string result;
    for (const auto& attribute : split_attributes(connection_string)) {
        size_t eq = attribute.find('=');
        std::string key = lower(trim(attribute.substr(0, eq)));
        if (key == "database" || key == "initial catalog") {
            continue;
        }
        result += attribute + ";";
    }
    result += "Database=" + quote_value(database) + ";";
    return result;
}

} // namespace mssql_mcp::db
