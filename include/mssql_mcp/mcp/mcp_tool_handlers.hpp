#pragma once

#include <mssql_mcp/db/i_db_connection.hpp>
#include <mssql_mcp/mcp/tool_registry.hpp>

namespace mssql_mcp {

// Register the eight SQL Server tools with the MCP tool registry.
// Handlers capture &factory by reference; every call opens its own
// connection from the connectionString argument and releases it before
// returning.
void RegisterSqlTools(ToolRegistry& registry, IConnectionFactory& factory);

} // namespace mssql_mcp
