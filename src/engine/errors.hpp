#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace mssql_mcp::engine {

// Parameter text could not be decoded; raised before any connection is used.
class MalformedParameters : public std::runtime_error {
public:
    explicit MalformedParameters(const std::string& decoder_message)
        : std::runtime_error("Invalid parameter JSON: " + decoder_message),
          decoder_message_(decoder_message) {}

    const std::string& decoder_message() const noexcept { return decoder_message_; }

private:
    std::string decoder_message_;
};

// The database rejected or failed the statement, or no connection could be
// opened. Carries the server's message unchanged.
class ExecutionFailure : public std::runtime_error {
public:
    explicit ExecutionFailure(const std::string& message,
                              std::optional<std::string> sqlstate = std::nullopt)
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    const std::optional<std::string>& sqlstate() const noexcept { return sqlstate_; }

private:
    std::optional<std::string> sqlstate_;
};

// A describe/lookup target does not exist.
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace mssql_mcp::engine
