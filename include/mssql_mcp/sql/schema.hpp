#pragma once

#include <mssql_mcp/core/cancellation.hpp>
#include <mssql_mcp/core/result.hpp>
#include <mssql_mcp/db/i_db_connection.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mssql_mcp {

// ---------------------------------------------------------------------------
// TableInfo: one base table.
// ---------------------------------------------------------------------------
struct TableInfo {
    std::string schema;
    std::string name;
    std::string type;  // always "BASE TABLE"
};

// ---------------------------------------------------------------------------
// ListTables: base tables, optionally limited to one schema.
//
// Source: INFORMATION_SCHEMA.TABLES, ordered by schema then name.
// A blank schema means all schemas.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<TableInfo>, Error> ListTables(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::optional<std::string>& schema = std::nullopt,
    const CancellationToken& cancel = CancellationToken());

// ---------------------------------------------------------------------------
// ColumnDescription: one column of a described table.
// ---------------------------------------------------------------------------
struct ColumnDescription {
    std::string name;
    std::string data_type;   // e.g. "nvarchar(50)", "decimal(10,2)", "int"
    bool nullable = false;
    std::optional<std::string> default_value;
    bool is_primary_key = false;
};

struct TableDescription {
    std::string schema;
    std::string table_name;
    std::vector<ColumnDescription> columns;
};

/// Render a catalog type: "type(length)" when the character length is
/// present and positive, else "type(precision,scale)" when both are present,
/// else the bare type. MAX types report length -1 and stay bare.
[[nodiscard]] std::string FormatDataType(
    const std::string& type,
    std::optional<std::int64_t> char_length,
    std::optional<std::int64_t> numeric_precision,
    std::optional<std::int64_t> numeric_scale);

// ---------------------------------------------------------------------------
// DescribeTable: columns of schema.table in ordinal order, with primary-key
// membership from TABLE_CONSTRAINTS / KEY_COLUMN_USAGE.
//
// An unknown table yields an empty column list, not an error.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<TableDescription, Error> DescribeTable(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::string& schema,
    const std::string& table_name,
    const CancellationToken& cancel = CancellationToken());

// ---------------------------------------------------------------------------
// DatabaseInfo: one user database on the instance.
// ---------------------------------------------------------------------------
struct DatabaseInfo {
    std::string name;
    std::int64_t database_id = 0;
    std::optional<SqlTimestamp> create_date;
    std::string state;           // sys.databases.state_desc, e.g. "ONLINE"
    std::string recovery_model;  // e.g. "FULL", "SIMPLE"
};

// ---------------------------------------------------------------------------
// ListDatabases: sys.databases minus master, tempdb, model and msdb,
// ordered by name.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<DatabaseInfo>, Error> ListDatabases(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const CancellationToken& cancel = CancellationToken());

} // namespace mssql_mcp
