#pragma once

#include <mssql_mcp/core/cancellation.hpp>
#include <mssql_mcp/core/result.hpp>
#include <mssql_mcp/db/i_db_connection.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mssql_mcp {

// ---------------------------------------------------------------------------
// Routines: stored procedures and user-defined functions, read from
// INFORMATION_SCHEMA.ROUTINES and sys.sql_modules.
// ---------------------------------------------------------------------------

struct ProcedureInfo {
    std::string schema;
    std::string name;
    std::optional<SqlTimestamp> created;
    std::optional<SqlTimestamp> last_altered;
};

struct FunctionInfo {
    std::string schema;
    std::string name;
    std::string return_type;  // "TABLE" for table-valued functions
    std::optional<SqlTimestamp> created;
    std::optional<SqlTimestamp> last_altered;
};

struct RoutineDefinition {
    std::string schema;
    std::string name;
    std::string type;                        // "PROCEDURE" or "FUNCTION"
    std::optional<std::string> return_type;  // functions only, "TABLE" if tabular
    std::optional<SqlTimestamp> created;
    std::optional<SqlTimestamp> last_altered;
    std::optional<std::string> definition;   // null for encrypted modules
};

/// Stored procedures, ordered by schema then name. A blank schema means all.
[[nodiscard]] Result<std::vector<ProcedureInfo>, Error> ListStoredProcedures(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::optional<std::string>& schema = std::nullopt,
    const CancellationToken& cancel = CancellationToken());

/// Scalar and table-valued functions, ordered by schema then name.
[[nodiscard]] Result<std::vector<FunctionInfo>, Error> ListFunctions(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::optional<std::string>& schema = std::nullopt,
    const CancellationToken& cancel = CancellationToken());

/// Source text of schema.routine_name. Fails with a NotFound error when no
/// routine of that name exists.
[[nodiscard]] Result<RoutineDefinition, Error> GetRoutineDefinition(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::string& schema,
    const std::string& routine_name,
    const CancellationToken& cancel = CancellationToken());

} // namespace mssql_mcp
