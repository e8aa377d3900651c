#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mssql_mcp::engine {

// Uniform result of every operation: either data or an error, never both.
class OperationResult {
public:
    static OperationResult ok(nlohmann::ordered_json data);
    // Write statement; data carries the count as well so success always has data
    static OperationResult ok_rows(std::int64_t rows_affected);
    static OperationResult failure(std::string message);

    bool success() const noexcept { return success_; }
    const std::optional<nlohmann::ordered_json>& data() const noexcept { return data_; }
    const std::optional<std::string>& error() const noexcept { return error_; }
    const std::optional<std::int64_t>& rows_affected() const noexcept { return rows_affected_; }

    // {"success": ..., "data"|"error": ..., "rowsAffected"?: n}
    nlohmann::ordered_json to_json() const;

private:
    OperationResult() = default;

    bool success_ = false;
    std::optional<nlohmann::ordered_json> data_;
    std::optional<std::string> error_;
    std::optional<std::int64_t> rows_affected_;
};

} // namespace mssql_mcp::engine
