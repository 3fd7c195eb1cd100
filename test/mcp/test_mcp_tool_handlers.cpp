#include <catch2/catch_test_macros.hpp>

#include <mssql_mcp/mcp/mcp_server.hpp>
#include <mssql_mcp/mcp/mcp_tool_handlers.hpp>
#include <mssql_mcp/mcp/tool_registry.hpp>
#include "mocks/mock_db_connection.hpp"

#include <set>
#include <sstream>
#include <string>

using namespace mssql_mcp;
using namespace mssql_mcp::testing;

namespace {

constexpr const char* kConn = "Server=localhost;Database=shop;Trusted_Connection=yes";

// Helper: make a registry with all tools registered against a mock factory.
ToolRegistry MakeRegistry(MockConnectionFactory& mock) {
    ToolRegistry registry;
    RegisterSqlTools(registry, mock);
    return registry;
}

// Parse the single text block of a tool result as JSON.
nlohmann::json ParseEnvelope(const ToolResult& result) {
    REQUIRE_FALSE(result.is_error);
    REQUIRE(result.content.is_array());
    REQUIRE(result.content.size() == 1);
    REQUIRE(result.content[0]["type"] == "text");
    return nlohmann::json::parse(result.content[0]["text"].get<std::string>());
}

std::string ErrorText(const ToolResult& result) {
    REQUIRE(result.is_error);
    return result.content[0]["text"].get<std::string>();
}

const SqlTimestamp kCreated{2023, 4, 1, 10, 0, 0, 0};
const SqlTimestamp kAltered{2024, 2, 15, 16, 45, 30, 0};

} // anonymous namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("RegisterSqlTools: registers all eight tools", "[mcp][tools]") {
    MockConnectionFactory mock;
    auto registry = MakeRegistry(mock);

    const std::set<std::string> expected = {
        "query", "list_tables", "describe_table", "list_databases",
        "execute_non_query", "list_stored_procedures", "list_functions",
        "get_routine_definition"};

    std::set<std::string> names;
    for (const auto& tool : registry.Tools()) {
        names.insert(tool.name);
        CHECK_FALSE(tool.description.empty());
        CHECK(tool.input_schema["type"] == "object");
        CHECK(tool.input_schema["properties"].contains("connectionString"));
    }
    CHECK(registry.Tools().size() == 8);
    CHECK(names == expected);
    CHECK(registry.Tools()[0].name == "query");
}

TEST_CASE("RegisterSqlTools: required parameters per tool", "[mcp][tools]") {
    MockConnectionFactory mock;
    auto registry = MakeRegistry(mock);

    auto required_of = [&](const std::string& name) {
        for (const auto& tool : registry.Tools()) {
            if (tool.name == name) return tool.input_schema["required"];
        }
        return nlohmann::json();
    };

    CHECK(required_of("query") == nlohmann::json::array({"connectionString", "query"}));
    CHECK(required_of("list_tables") == nlohmann::json::array({"connectionString"}));
    CHECK(required_of("describe_table") ==
          nlohmann::json::array({"connectionString", "schema", "tableName"}));
    CHECK(required_of("execute_non_query") ==
          nlohmann::json::array({"connectionString", "command"}));
    CHECK(required_of("get_routine_definition") ==
          nlohmann::json::array({"connectionString", "schema", "routineName"}));
}

TEST_CASE("RegisterSqlTools: query schema advertises defaults", "[mcp][tools]") {
    MockConnectionFactory mock;
    auto registry = MakeRegistry(mock);

    const auto& props = registry.Tools()[0].input_schema["properties"];
    CHECK(props["maxRows"]["type"] == "integer");
    CHECK(props["maxRows"]["default"] == 100);
    CHECK(props["timeoutSeconds"]["default"] == 30);
}

TEST_CASE("RegisterSqlTools: tools/list through the server", "[mcp][tools]") {
    MockConnectionFactory mock;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRegistry(mock), in, out);

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["tools"].size() == 8);
}

// ===========================================================================
// Parameter validation
// ===========================================================================

TEST_CASE("Tools: missing connectionString is a tool error", "[mcp][tools]") {
    MockConnectionFactory mock;
    auto registry = MakeRegistry(mock);

    for (const auto& tool : registry.Tools()) {
        auto result = registry.Execute(tool.name, nlohmann::json::object());
        CHECK(ErrorText(result) == "Missing required parameter: connectionString");
    }
    CHECK(mock.OpenedConnectionStrings().empty());
}

TEST_CASE("Tools: non-string parameter counts as missing", "[mcp][tools]") {
    MockConnectionFactory mock;
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("query", {{"connectionString", kConn}, {"query", 42}});
    CHECK(ErrorText(result) == "Missing required parameter: query");
    CHECK(mock.ExecuteCalls().empty());
}

TEST_CASE("Tools: second required parameter is checked", "[mcp][tools]") {
    MockConnectionFactory mock;
    auto registry = MakeRegistry(mock);

    CHECK(ErrorText(registry.Execute("describe_table",
                                     {{"connectionString", kConn}, {"schema", "dbo"}})) ==
          "Missing required parameter: tableName");
    CHECK(ErrorText(registry.Execute("get_routine_definition",
                                     {{"connectionString", kConn}, {"routineName", "x"}})) ==
          "Missing required parameter: schema");
    CHECK(ErrorText(registry.Execute("execute_non_query", {{"connectionString", kConn}})) ==
          "Missing required parameter: command");
}

TEST_CASE("Tools: empty strings are passed through", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueOpenError(ConnectionError("Neither DSN nor SERVER keyword supplied"));
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("list_tables", {{"connectionString", ""}}));
    CHECK(env["success"] == false);
    CHECK(env["type"] == "ConnectionFailed");
    REQUIRE(mock.OpenedConnectionStrings().size() == 1);
    CHECK(mock.OpenedConnectionStrings()[0].empty());
}

// ===========================================================================
// query
// ===========================================================================

TEST_CASE("query: success envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({
        MakeRow({{"Id", SqlValue::Integer(1)}, {"Name", SqlValue::Text("Widget")},
                 {"Price", SqlValue::Floating(9.5)}}),
        MakeRow({{"Id", SqlValue::Integer(2)}, {"Name", SqlValue::Null()},
                 {"Price", SqlValue::Floating(12.25)}}),
    });
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("query", {
        {"connectionString", kConn},
        {"query", "SELECT Id, Name, Price FROM dbo.Products"}}));

    CHECK(env["success"] == true);
    CHECK(env["rowCount"] == 2);
    CHECK(env["truncated"] == false);
    CHECK(env["message"].is_null());
    REQUIRE(env["data"].size() == 2);
    CHECK(env["data"][0]["Name"] == "Widget");
    CHECK(env["data"][1]["Name"].is_null());
    CHECK(env["data"][1]["Price"] == 12.25);
}

TEST_CASE("query: envelope text is pretty-printed in field order", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({});
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("query", {{"connectionString", kConn}, {"query", "SELECT 1 WHERE 1=0"}});
    REQUIRE_FALSE(result.is_error);
    CHECK(result.content[0]["text"] ==
          "{\n"
          "  \"success\": true,\n"
          "  \"rowCount\": 0,\n"
          "  \"data\": [],\n"
          "  \"truncated\": false,\n"
          "  \"message\": null\n"
          "}");
}

TEST_CASE("query: truncation message and limits", "[mcp][tools]") {
    MockConnectionFactory mock;
    std::vector<Row> rows;
    for (int i = 0; i < 5; ++i) {
        rows.push_back(MakeRow({{"n", SqlValue::Integer(i)}}));
    }
    mock.EnqueueRows(rows);
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("query", {
        {"connectionString", kConn}, {"query", "SELECT n FROM dbo.Numbers"},
        {"maxRows", 2}, {"timeoutSeconds", 5}}));

    CHECK(env["rowCount"] == 2);
    CHECK(env["truncated"] == true);
    CHECK(env["message"] ==
          "Results limited to 2 rows. Use WHERE or TOP clause to filter results.");
    CHECK(mock.ExecuteCalls()[0].timeout == std::chrono::seconds(5));
}

TEST_CASE("query: oversized maxRows saturates", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({});
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("query", {
        {"connectionString", kConn}, {"query", "SELECT 1"},
        {"maxRows", 99999999999LL}, {"timeoutSeconds", -4}}));
    CHECK(env["success"] == true);
    CHECK(mock.ExecuteCalls()[0].timeout == std::chrono::seconds(30));
}

TEST_CASE("query: execution failure is a success:false envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueResultSet(MockResultSet::Failing(ExecutionError("Invalid object name 'dbo.Nope'.")));
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("query", {{"connectionString", kConn}, {"query", "SELECT * FROM dbo.Nope"}});
    CHECK_FALSE(result.is_error);
    auto env = ParseEnvelope(result);
    CHECK(env["success"] == false);
    CHECK(env["error"] == "Invalid object name 'dbo.Nope'.");
    CHECK(env["type"] == "ExecutionFailed");
    CHECK(env.size() == 3);
}

TEST_CASE("query: timeout is reported as Timeout", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueResultSet(MockResultSet::Failing(TimeoutError()));
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("query", {
        {"connectionString", kConn}, {"query", "WAITFOR DELAY '00:01:00'"},
        {"timeoutSeconds", 1}}));
    CHECK(env["type"] == "Timeout");
}

// ===========================================================================
// list_tables / describe_table / list_databases
// ===========================================================================

TEST_CASE("list_tables: envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({
        MakeRow({{"TABLE_SCHEMA", SqlValue::Text("dbo")}, {"TABLE_NAME", SqlValue::Text("Orders")},
                 {"TABLE_TYPE", SqlValue::Text("BASE TABLE")}}),
    });
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("list_tables",
                                              {{"connectionString", kConn}, {"schema", "dbo"}}));
    CHECK(env["success"] == true);
    CHECK(env["tableCount"] == 1);
    CHECK(env["tables"][0] == nlohmann::json({{"schema", "dbo"}, {"name", "Orders"},
                                              {"type", "BASE TABLE"}}));
    CHECK(mock.ExecuteCalls()[0].params == SqlParams{"dbo"});
}

TEST_CASE("list_tables: null schema means all schemas", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({});
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("list_tables",
                                              {{"connectionString", kConn}, {"schema", nullptr}}));
    CHECK(env["tableCount"] == 0);
    CHECK(env["tables"].is_array());
    CHECK(mock.ExecuteCalls()[0].params.empty());
}

TEST_CASE("describe_table: envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({
        MakeRow({{"COLUMN_NAME", SqlValue::Text("Id")}, {"DATA_TYPE", SqlValue::Text("int")},
                 {"CHARACTER_MAXIMUM_LENGTH", SqlValue::Null()},
                 {"NUMERIC_PRECISION", SqlValue::Integer(10)}, {"NUMERIC_SCALE", SqlValue::Integer(0)},
                 {"IS_NULLABLE", SqlValue::Text("NO")}, {"COLUMN_DEFAULT", SqlValue::Null()},
                 {"IS_PRIMARY_KEY", SqlValue::Text("YES")}}),
        MakeRow({{"COLUMN_NAME", SqlValue::Text("Email")}, {"DATA_TYPE", SqlValue::Text("nvarchar")},
                 {"CHARACTER_MAXIMUM_LENGTH", SqlValue::Integer(255)},
                 {"NUMERIC_PRECISION", SqlValue::Null()}, {"NUMERIC_SCALE", SqlValue::Null()},
                 {"IS_NULLABLE", SqlValue::Text("YES")}, {"COLUMN_DEFAULT", SqlValue::Text("('')")},
                 {"IS_PRIMARY_KEY", SqlValue::Text("NO")}}),
    });
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("describe_table", {
        {"connectionString", kConn}, {"schema", "dbo"}, {"tableName", "Customers"}}));

    CHECK(env["success"] == true);
    CHECK(env["schema"] == "dbo");
    CHECK(env["tableName"] == "Customers");
    CHECK(env["columnCount"] == 2);
    CHECK(env["columns"][0] == nlohmann::json({{"name", "Id"}, {"dataType", "int(10,0)"},
                                               {"nullable", false}, {"defaultValue", nullptr},
                                               {"isPrimaryKey", true}}));
    CHECK(env["columns"][1]["dataType"] == "nvarchar(255)");
    CHECK(env["columns"][1]["defaultValue"] == "('')");
}

TEST_CASE("describe_table: unknown table is an empty success", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({});
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("describe_table", {
        {"connectionString", kConn}, {"schema", "dbo"}, {"tableName", "Nope"}}));
    CHECK(env["success"] == true);
    CHECK(env["columnCount"] == 0);
    CHECK(env["columns"] == nlohmann::json::array());
}

TEST_CASE("list_databases: envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({
        MakeRow({{"name", SqlValue::Text("shop")}, {"database_id", SqlValue::Integer(5)},
                 {"create_date", SqlValue::Timestamp(SqlTimestamp{2021, 6, 30, 12, 0, 0, 0})},
                 {"state_desc", SqlValue::Text("ONLINE")},
                 {"recovery_model_desc", SqlValue::Text("FULL")}}),
    });
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("list_databases", {{"connectionString", kConn}}));
    CHECK(env["databaseCount"] == 1);
    CHECK(env["databases"][0] == nlohmann::json({{"name", "shop"}, {"databaseId", 5},
                                                 {"createDate", "2021-06-30T12:00:00"},
                                                 {"state", "ONLINE"},
                                                 {"recoveryModel", "FULL"}}));
}

TEST_CASE("list_databases: connection failure", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueOpenError(ConnectionError("Login failed for user 'sa'."));
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("list_databases", {{"connectionString", kConn}}));
    CHECK(env["success"] == false);
    CHECK(env["error"] == "Login failed for user 'sa'.");
    CHECK(env["type"] == "ConnectionFailed");
}

// ===========================================================================
// execute_non_query
// ===========================================================================

TEST_CASE("execute_non_query: envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueNonQuery(Result<std::int64_t, Error>::Ok(4));
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("execute_non_query", {
        {"connectionString", kConn},
        {"command", "UPDATE dbo.Orders SET Status = 'Shipped' WHERE Id < 5"},
        {"timeoutSeconds", 0}}));

    CHECK(env["success"] == true);
    CHECK(env["affectedRows"] == 4);
    CHECK(env["message"] == "Command executed successfully. 4 row(s) affected.");
    REQUIRE(mock.ExecuteCalls().size() == 1);
    CHECK(mock.ExecuteCalls()[0].non_query);
    CHECK(mock.ExecuteCalls()[0].timeout == std::chrono::seconds(0));
}

TEST_CASE("execute_non_query: failure envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueNonQuery(Result<std::int64_t, Error>::Err(Error::FromSqlState(
        "OdbcConnection::ExecuteNonQuery", "42000", 102, "Incorrect syntax near 'FROMM'.")));
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("execute_non_query", {
        {"connectionString", kConn}, {"command", "DELETE FROMM dbo.T"}}));
    CHECK(env["success"] == false);
    CHECK(env["type"] == "ExecutionFailed");
}

// ===========================================================================
// Routines
// ===========================================================================

TEST_CASE("list_stored_procedures: envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({
        MakeRow({{"ROUTINE_SCHEMA", SqlValue::Text("dbo")},
                 {"ROUTINE_NAME", SqlValue::Text("usp_AddOrder")},
                 {"CREATED", SqlValue::Timestamp(kCreated)},
                 {"LAST_ALTERED", SqlValue::Timestamp(kAltered)}}),
    });
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("list_stored_procedures",
                                              {{"connectionString", kConn}}));
    CHECK(env["procedureCount"] == 1);
    CHECK(env["procedures"][0] == nlohmann::json({{"schema", "dbo"}, {"name", "usp_AddOrder"},
                                                  {"created", "2023-04-01T10:00:00"},
                                                  {"lastAltered", "2024-02-15T16:45:30"}}));
}

TEST_CASE("list_functions: envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({
        MakeRow({{"ROUTINE_SCHEMA", SqlValue::Text("dbo")},
                 {"ROUTINE_NAME", SqlValue::Text("tvf_OpenOrders")},
                 {"DATA_TYPE", SqlValue::Null()},
                 {"CREATED", SqlValue::Timestamp(kCreated)},
                 {"LAST_ALTERED", SqlValue::Null()}}),
    });
    auto registry = MakeRegistry(mock);

    auto env = ParseEnvelope(registry.Execute("list_functions",
                                              {{"connectionString", kConn}, {"schema", "dbo"}}));
    CHECK(env["functionCount"] == 1);
    CHECK(env["functions"][0]["returnType"] == "TABLE");
    CHECK(env["functions"][0]["lastAltered"].is_null());
}

TEST_CASE("get_routine_definition: envelope", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({
        MakeRow({{"ROUTINE_TYPE", SqlValue::Text("PROCEDURE")},
                 {"DATA_TYPE", SqlValue::Null()},
                 {"CREATED", SqlValue::Timestamp(kCreated)},
                 {"LAST_ALTERED", SqlValue::Timestamp(kAltered)},
                 {"definition", SqlValue::Text("CREATE PROCEDURE dbo.usp_AddOrder AS SELECT 1")}}),
    });
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("get_routine_definition", {
        {"connectionString", kConn}, {"schema", "dbo"}, {"routineName", "usp_AddOrder"}});
    auto env = ParseEnvelope(result);

    CHECK(env["success"] == true);
    CHECK(env["schema"] == "dbo");
    CHECK(env["name"] == "usp_AddOrder");
    CHECK(env["type"] == "PROCEDURE");
    CHECK(env["returnType"].is_null());
    CHECK(env["created"] == "2023-04-01T10:00:00");
    CHECK(env["definition"] == "CREATE PROCEDURE dbo.usp_AddOrder AS SELECT 1");

    // Procedures carry an explicit null return type.
    CHECK(result.content[0]["text"].get<std::string>().find("\"returnType\": null") !=
          std::string::npos);
}

TEST_CASE("get_routine_definition: not found", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({});
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("get_routine_definition", {
        {"connectionString", kConn}, {"schema", "dbo"}, {"routineName", "usp_Ghost"}});
    CHECK_FALSE(result.is_error);
    auto env = ParseEnvelope(result);
    CHECK(env["success"] == false);
    CHECK(env["error"] == "Routine 'dbo.usp_Ghost' not found");
    CHECK(env["type"] == "NotFound");
}

// ===========================================================================
// End to end through McpServer
// ===========================================================================

TEST_CASE("Tools: tools/call query over stdio", "[mcp][tools]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({MakeRow({{"answer", SqlValue::Integer(42)}})});

    nlohmann::json call = {
        {"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
        {"params", {{"name", "query"},
                    {"arguments", {{"connectionString", kConn},
                                   {"query", "SELECT 42 AS answer"}}}}}};
    std::istringstream in(call.dump() + "\n");
    std::ostringstream out;
    McpServer server(MakeRegistry(mock), in, out);

    server.Run();

    auto response = nlohmann::json::parse(out.str());
    CHECK(response["id"] == 7);
    CHECK_FALSE(response["result"].contains("isError"));
    auto env = nlohmann::json::parse(
        response["result"]["content"][0]["text"].get<std::string>());
    CHECK(env["data"][0]["answer"] == 42);
    CHECK(mock.ConnectionsClosed() == 1);
}

TEST_CASE("Tools: missing parameter over stdio sets isError", "[mcp][tools]") {
    MockConnectionFactory mock;

    nlohmann::json call = {
        {"jsonrpc", "2.0"}, {"id", 8}, {"method", "tools/call"},
        {"params", {{"name", "describe_table"},
                    {"arguments", {{"connectionString", kConn}}}}}};
    std::istringstream in(call.dump() + "\n");
    std::ostringstream out;
    McpServer server(MakeRegistry(mock), in, out);

    server.Run();

    auto response = nlohmann::json::parse(out.str());
    CHECK(response["result"]["isError"] == true);
    CHECK(response["result"]["content"][0]["text"] ==
          "Missing required parameter: schema");
}

// ===========================================================================
// Cancellation
// ===========================================================================

TEST_CASE("query: cancelled call is a success:false envelope", "[mcp][tools][cancel]") {
    MockConnectionFactory mock;
    mock.EnqueueRows({MakeRow({{"answer", SqlValue::Integer(42)}})});
    auto registry = MakeRegistry(mock);

    CancellationToken cancel;
    cancel.Cancel();
    auto env = ParseEnvelope(registry.Execute("query", {
        {"connectionString", kConn}, {"query", "SELECT 42 AS answer"}}, cancel));
    CHECK(env["success"] == false);
    CHECK(env["error"] == "Operation cancelled");
    CHECK(env["type"] == "ExecutionFailed");
    CHECK(mock.ConnectionsOpened() == 0);
}

TEST_CASE("Tools: notifications/cancelled stops a running query over stdio",
          "[mcp][tools][cancel]") {
    MockConnectionFactory mock;
    mock.EnqueueResultSet(MockResultSet::BlockingAfter(
        {MakeRow({{"id", SqlValue::Integer(1)}})}));

    nlohmann::json call = {
        {"jsonrpc", "2.0"}, {"id", "q-1"}, {"method", "tools/call"},
        {"params", {{"name", "query"},
                    {"arguments", {{"connectionString", kConn},
                                   {"query", "SELECT id FROM dbo.Huge"}}}}}};
    nlohmann::json cancel = {
        {"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
        {"params", {{"requestId", "q-1"}}}};
    std::istringstream in(call.dump() + "\n" + cancel.dump() + "\n");
    std::ostringstream out;
    McpServer server(MakeRegistry(mock), in, out);

    server.Run();

    auto response = nlohmann::json::parse(out.str());
    CHECK(response["id"] == "q-1");
    CHECK_FALSE(response["result"].contains("isError"));
    auto env = nlohmann::json::parse(
        response["result"]["content"][0]["text"].get<std::string>());
    CHECK(env["success"] == false);
    CHECK(env["type"] == "ExecutionFailed");
    CHECK(mock.ConnectionsClosed() == mock.ConnectionsOpened());
}
