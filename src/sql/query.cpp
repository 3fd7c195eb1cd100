#include <mssql_mcp/sql/query.hpp>

#include <mssql_mcp/core/log.hpp>

#include "sql_utils.hpp"

#include <algorithm>

namespace mssql_mcp {

namespace {

constexpr const char* kLogComponent = "query";

Result<QueryResult, Error> ReadPage(IRowCursor& cursor, int row_limit,
                                    const CancellationToken& cancel) {
    using R = Result<QueryResult, Error>;

    QueryResult result;
    result.row_limit = row_limit;
    result.rows.reserve(static_cast<std::size_t>(row_limit));

    while (static_cast<int>(result.rows.size()) < row_limit) {
        auto next = cursor.Next();
        if (next.IsErr()) {
            return R::Err(std::move(next).Error());
        }
        if (cancel.IsCancelled()) {
            return R::Err(Error::CancelledError("RunQuery"));
        }
        auto row = std::move(next).Value();
        if (!row.has_value()) {
            return R::Ok(std::move(result));
        }
        result.rows.push_back(std::move(*row));
    }

    // Look-ahead: one extra fetch, never stored.
    auto extra = cursor.Next();
    if (extra.IsErr()) {
        return R::Err(std::move(extra).Error());
    }
    if (cancel.IsCancelled()) {
        return R::Err(Error::CancelledError("RunQuery"));
    }
    result.truncated = extra.Value().has_value();
    if (result.truncated) {
        result.message = "Results limited to " + std::to_string(row_limit) +
                         " rows. Use WHERE or TOP clause to filter results.";
    }
    return R::Ok(std::move(result));
}

} // anonymous namespace

int ClampRowLimit(std::optional<int> max_rows) {
    if (!max_rows.has_value()) {
        return kDefaultRowLimit;
    }
    return std::clamp(*max_rows, 1, kMaxRowLimit);
}

std::chrono::seconds ResolveTimeout(std::optional<int> timeout_seconds) {
    if (!timeout_seconds.has_value() || *timeout_seconds < 0) {
        return std::chrono::seconds(kDefaultTimeoutSeconds);
    }
    return std::chrono::seconds(*timeout_seconds);
}

Result<QueryResult, Error> RunQuery(IConnectionFactory& factory,
                                    const QueryOptions& options,
                                    const CancellationToken& cancel) {
    using R = Result<QueryResult, Error>;

    const auto row_limit = ClampRowLimit(options.max_rows);
    const auto timeout = ResolveTimeout(options.timeout_seconds);

    auto connection = sql_utils::OpenConnection(factory, options.connection_string, cancel);
    if (connection.IsErr()) {
        return R::Err(std::move(connection).Error());
    }
    IDbConnection& db = *connection.Value();
    CancelCallback on_cancel(cancel, [&db] { db.Cancel(); });

    // The query text is the caller's and runs as-is, without parameters.
    auto page = db.ExecuteQuery(options.query, {}, timeout)
        .AndThen([&](std::unique_ptr<IRowCursor> cursor) {
            return ReadPage(*cursor, row_limit, cancel);
        });
    if (page.IsOk() && page.Value().truncated) {
        LogDebug(kLogComponent, "Result truncated at " + std::to_string(row_limit) + " rows");
    }
    return page;
}

Result<NonQueryResult, Error> ExecuteNonQuery(IConnectionFactory& factory,
                                              const NonQueryOptions& options,
                                              const CancellationToken& cancel) {
    using R = Result<NonQueryResult, Error>;

    auto connection = sql_utils::OpenConnection(factory, options.connection_string, cancel);
    if (connection.IsErr()) {
        return R::Err(std::move(connection).Error());
    }
    IDbConnection& db = *connection.Value();
    CancelCallback on_cancel(cancel, [&db] { db.Cancel(); });

    auto affected = db.ExecuteNonQuery(options.command, {},
                                       ResolveTimeout(options.timeout_seconds));
    if (affected.IsErr()) {
        return R::Err(std::move(affected).Error());
    }
    if (cancel.IsCancelled()) {
        return R::Err(Error::CancelledError("ExecuteNonQuery"));
    }

    return affected.Map([](std::int64_t count) {
        NonQueryResult result;
        result.affected_rows = count;
        result.message = "Command executed successfully. " +
                         std::to_string(count) + " row(s) affected.";
        return result;
    });
}

} // namespace mssql_mcp
