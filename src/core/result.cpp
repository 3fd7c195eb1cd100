#include <mssql_mcp/core/result.hpp>

namespace mssql_mcp {

namespace {

// SQLSTATE class is the first two characters; a few specific states matter
// on their own (timeouts live in the HY class with general errors).
ErrorCategory CategoryFromSqlState(const std::string& sql_state) {
    if (sql_state == "HYT00" || sql_state == "HYT01") {
        return ErrorCategory::Timeout;
    }
    if (sql_state.size() < 2) {
        return ErrorCategory::ExecutionFailed;
    }

    const auto cls = sql_state.substr(0, 2);
    // 08: connection exception, 28: invalid authorization,
    // IM: driver manager (driver missing, bad DSN, malformed attributes).
    if (cls == "08" || cls == "28" || cls == "IM") {
        return ErrorCategory::ConnectionFailed;
    }
    return ErrorCategory::ExecutionFailed;
}

} // anonymous namespace

Error Error::FromSqlState(const std::string& operation,
                          const std::string& sql_state,
                          int native_error,
                          const std::string& message) {
    Error error;
    error.operation = operation;
    error.message = message.empty()
        ? "Driver reported SQLSTATE " + sql_state + " without a message"
        : message;
    if (!sql_state.empty()) {
        error.sql_state = sql_state;
    }
    error.native_error = native_error;
    error.category = CategoryFromSqlState(sql_state);
    return error;
}

} // namespace mssql_mcp
