#include <mssql_mcp/mcp/mcp_tool_handlers.hpp>

#include <mssql_mcp/core/log.hpp>
#include <mssql_mcp/mcp/json_envelope.hpp>
#include <mssql_mcp/sql/query.hpp>
#include <mssql_mcp/sql/routines.hpp>
#include <mssql_mcp/sql/schema.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace mssql_mcp {

namespace {

constexpr const char* kLogComponent = "tools";

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolResult MakeOkResult(const Envelope& envelope) {
    return EnvelopeResult(envelope);
}

// Database failures travel inside the envelope, not as isError.
ToolResult MakeErrorResult(const std::string& tool, const Error& error) {
    LogWarn(kLogComponent, tool + " failed (" + error.CategoryName() + "): " +
                               error.ToString());
    return EnvelopeResult(ErrorEnvelope(error));
}

ToolResult MakeParamError(const std::string& msg) {
    return MakeTextResult(msg, true);
}

// Get a required string param. Returns nullopt and sets out_error when the
// key is missing or not a string. Empty strings are passed through.
std::optional<std::string> RequireString(const nlohmann::json& params,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!params.contains(key) || !params[key].is_string()) {
        out_error = MakeParamError("Missing required parameter: " + key);
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

// Get an optional string param; null or non-string counts as absent.
std::optional<std::string> OptString(const nlohmann::json& params,
                                     const std::string& key) {
    if (params.contains(key) && params[key].is_string()) {
        return params[key].get<std::string>();
    }
    return std::nullopt;
}

// Get an optional int param, saturated to the int range.
std::optional<int> OptInt(const nlohmann::json& params, const std::string& key) {
    if (!params.contains(key)) {
        return std::nullopt;
    }
    const auto& value = params[key];
    if (value.is_number_unsigned()) {
        auto v = value.get<std::uint64_t>();
        return v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                   ? std::numeric_limits<int>::max()
                   : static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        auto v = value.get<std::int64_t>();
        if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
        if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
        return static_cast<int>(v);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc, int default_val) {
    return {{"type", "integer"}, {"description", desc}, {"default", default_val}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

const char* const kConnectionStringDesc = "The SQL Server connection string";
const char* const kSchemaFilterDesc =
    "Optional schema name to filter (default: all schemas)";
const char* const kTimeoutDesc = "Optional timeout in seconds (default: 30)";

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// query
ToolResult HandleQuery(IConnectionFactory& factory, const nlohmann::json& params,
                       const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;
    auto query = RequireString(params, "query", err);
    if (!query) return err;

    QueryOptions opts;
    opts.connection_string = *connection_string;
    opts.query = *query;
    opts.max_rows = OptInt(params, "maxRows");
    opts.timeout_seconds = OptInt(params, "timeoutSeconds");

    auto result = RunQuery(factory, opts, cancel);
    if (result.IsErr()) return MakeErrorResult("query", result.Error());

    const auto& page = result.Value();
    Envelope data = Envelope::array();
    for (const auto& row : page.rows) {
        data.push_back(RowToJson(row));
    }

    auto j = SuccessEnvelope();
    j["rowCount"] = page.rows.size();
    j["data"] = std::move(data);
    j["truncated"] = page.truncated;
    j["message"] = OptionalText(page.message);
    return MakeOkResult(j);
}

// list_tables
ToolResult HandleListTables(IConnectionFactory& factory,
                            const nlohmann::json& params,
                            const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;

    auto result = ListTables(factory, *connection_string, OptString(params, "schema"),
                             cancel);
    if (result.IsErr()) return MakeErrorResult("list_tables", result.Error());

    Envelope tables = Envelope::array();
    for (const auto& t : result.Value()) {
        Envelope entry = Envelope::object();
        entry["schema"] = t.schema;
        entry["name"] = t.name;
        entry["type"] = t.type;
        tables.push_back(std::move(entry));
    }

    auto j = SuccessEnvelope();
    j["tableCount"] = result.Value().size();
    j["tables"] = std::move(tables);
    return MakeOkResult(j);
}

// describe_table
ToolResult HandleDescribeTable(IConnectionFactory& factory,
                               const nlohmann::json& params,
                               const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;
    auto schema = RequireString(params, "schema", err);
    if (!schema) return err;
    auto table_name = RequireString(params, "tableName", err);
    if (!table_name) return err;

    auto result = DescribeTable(factory, *connection_string, *schema, *table_name,
                                cancel);
    if (result.IsErr()) return MakeErrorResult("describe_table", result.Error());

    const auto& description = result.Value();
    Envelope columns = Envelope::array();
    for (const auto& c : description.columns) {
        Envelope entry = Envelope::object();
        entry["name"] = c.name;
        entry["dataType"] = c.data_type;
        entry["nullable"] = c.nullable;
        entry["defaultValue"] = OptionalText(c.default_value);
        entry["isPrimaryKey"] = c.is_primary_key;
        columns.push_back(std::move(entry));
    }

    auto j = SuccessEnvelope();
    j["schema"] = description.schema;
    j["tableName"] = description.table_name;
    j["columnCount"] = description.columns.size();
    j["columns"] = std::move(columns);
    return MakeOkResult(j);
}

// list_databases
ToolResult HandleListDatabases(IConnectionFactory& factory,
                               const nlohmann::json& params,
                               const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;

    auto result = ListDatabases(factory, *connection_string, cancel);
    if (result.IsErr()) return MakeErrorResult("list_databases", result.Error());

    Envelope databases = Envelope::array();
    for (const auto& db : result.Value()) {
        Envelope entry = Envelope::object();
        entry["name"] = db.name;
        entry["databaseId"] = db.database_id;
        entry["createDate"] = TimestampToJson(db.create_date);
        entry["state"] = db.state;
        entry["recoveryModel"] = db.recovery_model;
        databases.push_back(std::move(entry));
    }

    auto j = SuccessEnvelope();
    j["databaseCount"] = result.Value().size();
    j["databases"] = std::move(databases);
    return MakeOkResult(j);
}

// execute_non_query
ToolResult HandleExecuteNonQuery(IConnectionFactory& factory,
                                 const nlohmann::json& params,
                                 const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;
    auto command = RequireString(params, "command", err);
    if (!command) return err;

    NonQueryOptions opts;
    opts.connection_string = *connection_string;
    opts.command = *command;
    opts.timeout_seconds = OptInt(params, "timeoutSeconds");

    auto result = ExecuteNonQuery(factory, opts, cancel);
    if (result.IsErr()) return MakeErrorResult("execute_non_query", result.Error());

    auto j = SuccessEnvelope();
    j["affectedRows"] = result.Value().affected_rows;
    j["message"] = result.Value().message;
    return MakeOkResult(j);
}

// list_stored_procedures
ToolResult HandleListStoredProcedures(IConnectionFactory& factory,
                                      const nlohmann::json& params,
                                      const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;

    auto result = ListStoredProcedures(factory, *connection_string,
                                       OptString(params, "schema"), cancel);
    if (result.IsErr()) return MakeErrorResult("list_stored_procedures", result.Error());

    Envelope procedures = Envelope::array();
    for (const auto& p : result.Value()) {
        Envelope entry = Envelope::object();
        entry["schema"] = p.schema;
        entry["name"] = p.name;
        entry["created"] = TimestampToJson(p.created);
        entry["lastAltered"] = TimestampToJson(p.last_altered);
        procedures.push_back(std::move(entry));
    }

    auto j = SuccessEnvelope();
    j["procedureCount"] = result.Value().size();
    j["procedures"] = std::move(procedures);
    return MakeOkResult(j);
}

// list_functions
ToolResult HandleListFunctions(IConnectionFactory& factory,
                               const nlohmann::json& params,
                               const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;

    auto result = ListFunctions(factory, *connection_string,
                                OptString(params, "schema"), cancel);
    if (result.IsErr()) return MakeErrorResult("list_functions", result.Error());

    Envelope functions = Envelope::array();
    for (const auto& f : result.Value()) {
        Envelope entry = Envelope::object();
        entry["schema"] = f.schema;
        entry["name"] = f.name;
        entry["returnType"] = f.return_type;
        entry["created"] = TimestampToJson(f.created);
        entry["lastAltered"] = TimestampToJson(f.last_altered);
        functions.push_back(std::move(entry));
    }

    auto j = SuccessEnvelope();
    j["functionCount"] = result.Value().size();
    j["functions"] = std::move(functions);
    return MakeOkResult(j);
}

// get_routine_definition
ToolResult HandleGetRoutineDefinition(IConnectionFactory& factory,
                                      const nlohmann::json& params,
                                      const CancellationToken& cancel) {
    ToolResult err;
    auto connection_string = RequireString(params, "connectionString", err);
    if (!connection_string) return err;
    auto schema = RequireString(params, "schema", err);
    if (!schema) return err;
    auto routine_name = RequireString(params, "routineName", err);
    if (!routine_name) return err;

    auto result = GetRoutineDefinition(factory, *connection_string, *schema,
                                       *routine_name, cancel);
    if (result.IsErr()) return MakeErrorResult("get_routine_definition", result.Error());

    const auto& r = result.Value();
    auto j = SuccessEnvelope();
    j["schema"] = r.schema;
    j["name"] = r.name;
    j["type"] = r.type;
    j["returnType"] = OptionalText(r.return_type);
    j["created"] = TimestampToJson(r.created);
    j["lastAltered"] = TimestampToJson(r.last_altered);
    j["definition"] = OptionalText(r.definition);
    return MakeOkResult(j);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterSqlTools
// ---------------------------------------------------------------------------

void RegisterSqlTools(ToolRegistry& registry, IConnectionFactory& factory) {
    registry.Register(
        "query",
        "Execute a SQL query against a SQL Server database and return the "
        "results (limited to 100 rows by default)",
        MakeSchema(
            {{"connectionString", StringProp(kConnectionStringDesc)},
             {"query", StringProp("The SQL query to execute")},
             {"maxRows", IntProp("Maximum number of rows to return "
                                 "(default: 100, max: 1000)", kDefaultRowLimit)},
             {"timeoutSeconds", IntProp(kTimeoutDesc, kDefaultTimeoutSeconds)}},
            nlohmann::json::array({"connectionString", "query"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleQuery(factory, p, c);
        });

    registry.Register(
        "list_tables",
        "List all tables in a SQL Server database",
        MakeSchema({{"connectionString", StringProp(kConnectionStringDesc)},
                    {"schema", StringProp(kSchemaFilterDesc)}},
                   nlohmann::json::array({"connectionString"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleListTables(factory, p, c);
        });

    registry.Register(
        "describe_table",
        "Get detailed information about a table's structure including "
        "columns, data types, and constraints",
        MakeSchema({{"connectionString", StringProp(kConnectionStringDesc)},
                    {"schema", StringProp("The schema name")},
                    {"tableName", StringProp("The table name")}},
                   nlohmann::json::array({"connectionString", "schema", "tableName"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleDescribeTable(factory, p, c);
        });

    registry.Register(
        "list_databases",
        "List all databases on the SQL Server instance",
        MakeSchema({{"connectionString",
                     StringProp("The SQL Server connection string (connect to "
                                "master or any database)")}},
                   nlohmann::json::array({"connectionString"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleListDatabases(factory, p, c);
        });

    registry.Register(
        "execute_non_query",
        "Execute a non-query SQL command (INSERT, UPDATE, DELETE, CREATE, "
        "etc.) and return the number of affected rows",
        MakeSchema({{"connectionString", StringProp(kConnectionStringDesc)},
                    {"command", StringProp("The SQL command to execute")},
                    {"timeoutSeconds", IntProp(kTimeoutDesc, kDefaultTimeoutSeconds)}},
                   nlohmann::json::array({"connectionString", "command"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleExecuteNonQuery(factory, p, c);
        });

    registry.Register(
        "list_stored_procedures",
        "List all stored procedures in a SQL Server database",
        MakeSchema({{"connectionString", StringProp(kConnectionStringDesc)},
                    {"schema", StringProp(kSchemaFilterDesc)}},
                   nlohmann::json::array({"connectionString"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleListStoredProcedures(factory, p, c);
        });

    registry.Register(
        "list_functions",
        "List all user-defined functions in a SQL Server database",
        MakeSchema({{"connectionString", StringProp(kConnectionStringDesc)},
                    {"schema", StringProp(kSchemaFilterDesc)}},
                   nlohmann::json::array({"connectionString"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleListFunctions(factory, p, c);
        });

    registry.Register(
        "get_routine_definition",
        "Get the source code/definition of a stored procedure or function",
        MakeSchema({{"connectionString", StringProp(kConnectionStringDesc)},
                    {"schema", StringProp("The schema name")},
                    {"routineName",
                     StringProp("The routine name (stored procedure or function)")}},
                   nlohmann::json::array({"connectionString", "schema", "routineName"})),
        [&factory](const nlohmann::json& p, const CancellationToken& c) {
            return HandleGetRoutineDefinition(factory, p, c);
        });
}

} // namespace mssql_mcp
