#include "odbc_error.hpp"
#include <sstream>
#include <cstring>

namespace mssql_mcp::core {

namespace {

// The server message is what callers act on; the failing call is only context.
// SQL Server prefixes messages with the driver chain ("[Microsoft][ODBC Driver 18
// for SQL Server][SQL Server]"), which is stripped.
std::string strip_driver_prefix(const std::string& message) {
    size_t pos = 0;
    while (pos < message.size() && message[pos] == '[') {
        size_t close = message.find(']', pos);
        if (close == std::string::npos) {
            break;
        }
        pos = close + 1;
    }
    return pos < message.size() ? message.substr(pos) : message;
}

std::string build_message(const std::string& context, const std::vector<OdbcDiagnostic>& diagnostics) {
    if (diagnostics.empty()) {
        return context.empty() ? "ODBC error" : context + " failed";
    }
    return strip_driver_prefix(diagnostics.front().message);
}

} // anonymous namespace

OdbcError OdbcError::from_handle(SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context) {
    std::vector<OdbcDiagnostic> diagnostics;
    
    SQLSMALLINT rec = 1;
    SQLCHAR sqlstate[6] = {0};
    SQLCHAR message[SQL_MAX_MESSAGE_LENGTH] = {0};
    SQLINTEGER native_error = 0;
    SQLSMALLINT text_length = 0;
    
    while (handle != SQL_NULL_HANDLE &&
           SQL_SUCCEEDED(SQLGetDiagRec(handle_type, handle, rec,
                                       sqlstate, &native_error,
                                       message, SQL_MAX_MESSAGE_LENGTH, &text_length))) {
        OdbcDiagnostic diag;
        diag.sqlstate = reinterpret_cast<char*>(sqlstate);
        diag.native_error = native_error;
        diag.message = reinterpret_cast<char*>(message);
        diag.record_number = rec;
        
        diagnostics.push_back(std::move(diag));
        rec++;
    }
    
    return OdbcError(context, std::move(diagnostics));
}

OdbcError::OdbcError(const std::string& message)
    : std::runtime_error(message) {
}

OdbcError::OdbcError(const std::string& context, std::vector<OdbcDiagnostic> diagnostics)
    : std::runtime_error(build_message(context, diagnostics)),
      context_(context),
      diagnostics_(std::move(diagnostics)) {
}

std::optional<std::string> OdbcError::sqlstate() const {
    if (diagnostics_.empty()) {
        return std::nullopt;
    }
    return diagnostics_.front().sqlstate;
}

std::string OdbcError::format_diagnostics() const {
    std::ostringstream oss;
    if (!context_.empty()) {
        oss << context_ << ": ";
    }
    oss << what() << "\n";
    
    for (const auto& diag : diagnostics_) {
        oss << "  [" << diag.sqlstate << "] (Native: " << diag.native_error << ") "
            << diag.message << "\n";
    }
    
    return oss.str();
}

void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context) {
    if (!SQL_SUCCEEDED(ret)) {
        throw OdbcError::from_handle(handle_type, handle, context);
    }
}

} // namespace mssql_mcp::core
