#pragma once

#include <mssql_mcp/core/cancellation.hpp>
#include <mssql_mcp/core/result.hpp>
#include <mssql_mcp/db/i_db_connection.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mssql_mcp {

constexpr int kDefaultRowLimit = 100;
constexpr int kMaxRowLimit = 1000;
constexpr int kDefaultTimeoutSeconds = 30;

/// Effective row limit: default 100 when unset, clamped into [1, 1000].
[[nodiscard]] int ClampRowLimit(std::optional<int> max_rows);

/// Effective statement timeout: default 30s when unset or negative.
/// Zero is kept and means no timeout.
[[nodiscard]] std::chrono::seconds ResolveTimeout(std::optional<int> timeout_seconds);

// ---------------------------------------------------------------------------
// RunQuery: execute caller-supplied SQL verbatim and return a bounded page.
//
// At most the row limit is stored. Once the limit is reached, exactly one
// more fetch is made and discarded; whether it produced a row sets
// `truncated`.
//
// Cancelling the token aborts the connect, execute or read in progress; the
// call then fails with Error::CancelledError (SQLSTATE HY008).
// ---------------------------------------------------------------------------
struct QueryOptions {
    std::string connection_string;
    std::string query;
    std::optional<int> max_rows;
    std::optional<int> timeout_seconds;
};

struct QueryResult {
    std::vector<Row> rows;
    bool truncated = false;
    int row_limit = kDefaultRowLimit;
    std::optional<std::string> message;  // set only when truncated
};

[[nodiscard]] Result<QueryResult, Error> RunQuery(
    IConnectionFactory& factory,
    const QueryOptions& options,
    const CancellationToken& cancel = CancellationToken());

// ---------------------------------------------------------------------------
// ExecuteNonQuery: execute a command for effect, report affected rows.
// ---------------------------------------------------------------------------
struct NonQueryOptions {
    std::string connection_string;
    std::string command;
    std::optional<int> timeout_seconds;
};

struct NonQueryResult {
    std::int64_t affected_rows = 0;
    std::string message;
};

[[nodiscard]] Result<NonQueryResult, Error> ExecuteNonQuery(
    IConnectionFactory& factory,
    const NonQueryOptions& options,
    const CancellationToken& cancel = CancellationToken());

} // namespace mssql_mcp
