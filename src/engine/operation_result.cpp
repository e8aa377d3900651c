#include "operation_result.hpp"

namespace mssql_mcp::engine {

OperationResult OperationResult::ok(nlohmann::ordered_json data) {
    OperationResult result;
    result.success_ = true;
    result.data_ = std::move(data);
    return result;
}

OperationResult OperationResult::ok_rows(std::int64_t rows_affected) {
    OperationResult result;
    result.success_ = true;
    result.data_ = nlohmann::ordered_json{{"rows_affected", rows_affected}};
    result.rows_affected_ = rows_affected;
    return result;
}

OperationResult OperationResult::failure(std::string message) {
    OperationResult result;
    result.error_ = std::move(message);
    return result;
}

nlohmann::ordered_json OperationResult::to_json() const {
    nlohmann::ordered_json envelope = nlohmann::ordered_json::object();
    envelope["success"] = success_;
    if (data_) {
        envelope["data"] = *data_;
    }
    if (error_) {
        envelope["error"] = *error_;
    }
    if (rows_affected_) {
        envelope["rowsAffected"] = *rows_affected_;
    }
    return envelope;
}

} // namespace mssql_mcp::engine
