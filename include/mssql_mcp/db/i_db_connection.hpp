#pragma once

#include <mssql_mcp/core/result.hpp>
#include <mssql_mcp/db/value.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mssql_mcp {

// ---------------------------------------------------------------------------
// ColumnInfo: result-set metadata for one column.
// ---------------------------------------------------------------------------
struct ColumnInfo {
    std::string name;
    int sql_type = 0;  // ODBC SQL type code as reported by the driver
};

// Positional parameters for '?' markers, always bound as Unicode text.
using SqlParams = std::vector<std::string>;

// ---------------------------------------------------------------------------
// IRowCursor: forward-only reader over one executed statement.
//
// Next() yields the next row, nullopt at the end of the result set, or an
// Error if the fetch fails. Destroying the cursor releases the statement.
// ---------------------------------------------------------------------------
class IRowCursor {
public:
    virtual ~IRowCursor() = default;

    IRowCursor(const IRowCursor&) = delete;
    IRowCursor& operator=(const IRowCursor&) = delete;
    IRowCursor(IRowCursor&&) = delete;
    IRowCursor& operator=(IRowCursor&&) = delete;

    [[nodiscard]] virtual const std::vector<ColumnInfo>& Columns() const = 0;
    [[nodiscard]] virtual Result<std::optional<Row>, Error> Next() = 0;

protected:
    IRowCursor() = default;
};

// ---------------------------------------------------------------------------
// IDbConnection: one open connection, used for a single tool call.
//
// A cursor returned by ExecuteQuery must be destroyed before its connection.
// A zero timeout means no statement timeout.
// ---------------------------------------------------------------------------
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    IDbConnection(const IDbConnection&) = delete;
    IDbConnection& operator=(const IDbConnection&) = delete;
    IDbConnection(IDbConnection&&) = delete;
    IDbConnection& operator=(IDbConnection&&) = delete;

    [[nodiscard]] virtual Result<std::unique_ptr<IRowCursor>, Error> ExecuteQuery(
        std::string_view sql,
        const SqlParams& params,
        std::chrono::seconds timeout) = 0;

    /// Execute for effect. Returns the number of affected rows summed over
    /// every statement in the batch, or -1 if no statement reported a count.
    [[nodiscard]] virtual Result<std::int64_t, Error> ExecuteNonQuery(
        std::string_view sql,
        const SqlParams& params,
        std::chrono::seconds timeout) = 0;

    /// Abort the statement currently executing or being read on this
    /// connection. Safe to call from another thread; does nothing when idle.
    /// The interrupted call fails with SQLSTATE HY008.
    virtual void Cancel() = 0;

protected:
    IDbConnection() = default;
};

// ---------------------------------------------------------------------------
// IConnectionFactory: opens connections from an opaque connection string.
//
// All SQL operations depend on this interface rather than on ODBC, which
// keeps them testable offline with MockConnectionFactory.
// ---------------------------------------------------------------------------
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    IConnectionFactory(const IConnectionFactory&) = delete;
    IConnectionFactory& operator=(const IConnectionFactory&) = delete;
    IConnectionFactory(IConnectionFactory&&) = delete;
    IConnectionFactory& operator=(IConnectionFactory&&) = delete;

    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>, Error> Open(
        const std::string& connection_string) = 0;

protected:
    IConnectionFactory() = default;
};

} // namespace mssql_mcp
