#pragma once

#include <mssql_mcp/core/cancellation.hpp>
#include <mssql_mcp/core/result.hpp>
#include <mssql_mcp/db/i_db_connection.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mssql_mcp::sql_utils {

// Catalog reads use the driver's customary command timeout.
constexpr std::chrono::seconds kCatalogTimeout{30};

inline bool HasText(const std::optional<std::string>& value) {
    if (!value.has_value()) {
        return false;
    }
    return std::any_of(value->begin(), value->end(), [](unsigned char c) {
        return !std::isspace(c);
    });
}

// Append "AND <column> = ?" and bind the schema when a non-blank schema is
// given. Only the presence of the clause is decided here; the value itself
// is never spliced into the SQL text.
inline void AppendSchemaFilter(std::string& sql, SqlParams& params,
                               std::string_view column,
                               const std::optional<std::string>& schema) {
    if (!HasText(schema)) {
        return;
    }
    sql += " AND ";
    sql += column;
    sql += " = ?";
    params.push_back(*schema);
}

inline std::string TextOr(const Row& row, std::size_t index,
                          const std::string& fallback = "") {
    auto value = row.TextAt(index);
    return value.has_value() ? *value : fallback;
}

// Open a connection unless the call is already cancelled. Connecting cannot
// be interrupted; a cancel that arrives meanwhile is noticed once Open returns
// and the fresh connection is dropped.
inline Result<std::unique_ptr<IDbConnection>, Error> OpenConnection(
    IConnectionFactory& factory, const std::string& connection_string,
    const CancellationToken& cancel) {
    using R = Result<std::unique_ptr<IDbConnection>, Error>;

    if (cancel.IsCancelled()) {
        return R::Err(Error::CancelledError("Open"));
    }
    auto connection = factory.Open(connection_string);
    if (connection.IsOk() && cancel.IsCancelled()) {
        return R::Err(Error::CancelledError("Open"));
    }
    return connection;
}

// Drain a cursor, checking for cancellation between rows.
inline Result<std::vector<Row>, Error> ReadAll(IRowCursor& cursor,
                                               const CancellationToken& cancel) {
    using R = Result<std::vector<Row>, Error>;

    std::vector<Row> rows;
    for (;;) {
        auto next = cursor.Next();
        if (next.IsErr()) {
            return R::Err(std::move(next).Error());
        }
        if (cancel.IsCancelled()) {
            return R::Err(Error::CancelledError("Fetch"));
        }
        if (!next.Value().has_value()) {
            break;
        }
        rows.push_back(*std::move(next).Value());
    }
    return R::Ok(std::move(rows));
}

// Open a connection, run one catalog query and read every row. The
// connection and cursor are released before returning on every path, and a
// cancel interrupts the running statement through IDbConnection::Cancel.
inline Result<std::vector<Row>, Error> FetchAll(
    IConnectionFactory& factory, const std::string& connection_string,
    std::string_view sql, const SqlParams& params,
    const CancellationToken& cancel,
    std::chrono::seconds timeout = kCatalogTimeout) {
    using R = Result<std::vector<Row>, Error>;

    auto connection = OpenConnection(factory, connection_string, cancel);
    if (connection.IsErr()) {
        return R::Err(std::move(connection).Error());
    }
    IDbConnection& db = *connection.Value();
    CancelCallback on_cancel(cancel, [&db] { db.Cancel(); });

    return db.ExecuteQuery(sql, params, timeout)
        .AndThen([&cancel](std::unique_ptr<IRowCursor> cursor) {
            return ReadAll(*cursor, cancel);
        });
}

// Like FetchAll, but consumes at most the first row.
inline Result<std::optional<Row>, Error> FetchFirst(
    IConnectionFactory& factory, const std::string& connection_string,
    std::string_view sql, const SqlParams& params,
    const CancellationToken& cancel,
    std::chrono::seconds timeout = kCatalogTimeout) {
    using R = Result<std::optional<Row>, Error>;

    auto connection = OpenConnection(factory, connection_string, cancel);
    if (connection.IsErr()) {
        return R::Err(std::move(connection).Error());
    }
    IDbConnection& db = *connection.Value();
    CancelCallback on_cancel(cancel, [&db] { db.Cancel(); });

    return db.ExecuteQuery(sql, params, timeout)
        .AndThen([&cancel](std::unique_ptr<IRowCursor> cursor) -> R {
            auto first = cursor->Next();
            if (first.IsOk() && cancel.IsCancelled()) {
                return R::Err(Error::CancelledError("Fetch"));
            }
            return first;
        });
}

} // namespace mssql_mcp::sql_utils
