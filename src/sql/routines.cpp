#include <mssql_mcp/sql/routines.hpp>

#include "sql_utils.hpp"

namespace mssql_mcp {

namespace {

constexpr const char* kListProceduresSql =
    "SELECT ROUTINE_SCHEMA, ROUTINE_NAME, CREATED, LAST_ALTERED"
    " FROM INFORMATION_SCHEMA.ROUTINES"
    " WHERE ROUTINE_TYPE = 'PROCEDURE'";

constexpr const char* kListFunctionsSql =
    "SELECT ROUTINE_SCHEMA, ROUTINE_NAME, DATA_TYPE, CREATED, LAST_ALTERED"
    " FROM INFORMATION_SCHEMA.ROUTINES"
    " WHERE ROUTINE_TYPE = 'FUNCTION'";

constexpr const char* kRoutineOrder = " ORDER BY ROUTINE_SCHEMA, ROUTINE_NAME";

constexpr const char* kRoutineDefinitionSql =
    "SELECT r.ROUTINE_TYPE, r.DATA_TYPE, r.CREATED, r.LAST_ALTERED, m.definition"
    " FROM INFORMATION_SCHEMA.ROUTINES r"
    " INNER JOIN sys.sql_modules m"
    "   ON OBJECT_ID(QUOTENAME(r.ROUTINE_SCHEMA) + '.' + QUOTENAME(r.ROUTINE_NAME)) = m.object_id"
    " WHERE r.ROUTINE_SCHEMA = ?"
    "   AND r.ROUTINE_NAME = ?";

} // anonymous namespace

Result<std::vector<ProcedureInfo>, Error> ListStoredProcedures(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::optional<std::string>& schema,
    const CancellationToken& cancel) {
    std::string sql = kListProceduresSql;
    SqlParams params;
    sql_utils::AppendSchemaFilter(sql, params, "ROUTINE_SCHEMA", schema);
    sql += kRoutineOrder;

    return sql_utils::FetchAll(factory, connection_string, sql, params, cancel)
        .Map([](const std::vector<Row>& rows) {
            std::vector<ProcedureInfo> procedures;
            procedures.reserve(rows.size());
            for (const auto& row : rows) {
                procedures.push_back(ProcedureInfo{sql_utils::TextOr(row, 0),
                                                   sql_utils::TextOr(row, 1),
                                                   row.TimestampAt(2),
                                                   row.TimestampAt(3)});
            }
            return procedures;
        });
}

Result<std::vector<FunctionInfo>, Error> ListFunctions(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::optional<std::string>& schema,
    const CancellationToken& cancel) {
    std::string sql = kListFunctionsSql;
    SqlParams params;
    sql_utils::AppendSchemaFilter(sql, params, "ROUTINE_SCHEMA", schema);
    sql += kRoutineOrder;

    return sql_utils::FetchAll(factory, connection_string, sql, params, cancel)
        .Map([](const std::vector<Row>& rows) {
            std::vector<FunctionInfo> functions;
            functions.reserve(rows.size());
            for (const auto& row : rows) {
                // Table-valued functions have no scalar DATA_TYPE.
                functions.push_back(FunctionInfo{sql_utils::TextOr(row, 0),
                                                 sql_utils::TextOr(row, 1),
                                                 sql_utils::TextOr(row, 2, "TABLE"),
                                                 row.TimestampAt(3),
                                                 row.TimestampAt(4)});
            }
            return functions;
        });
}

Result<RoutineDefinition, Error> GetRoutineDefinition(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::string& schema,
    const std::string& routine_name,
    const CancellationToken& cancel) {
    using R = Result<RoutineDefinition, Error>;

    return sql_utils::FetchFirst(factory, connection_string, kRoutineDefinitionSql,
                                 SqlParams{schema, routine_name}, cancel)
        .AndThen([&](const std::optional<Row>& row) {
            if (!row.has_value()) {
                return R::Err(Error::NotFoundError(
                    "GetRoutineDefinition",
                    "Routine '" + schema + "." + routine_name + "' not found"));
            }

            const Row& found = *row;
            RoutineDefinition definition;
            definition.schema = schema;
            definition.name = routine_name;
            definition.type = sql_utils::TextOr(found, 0);
            if (definition.type == "FUNCTION") {
                definition.return_type = sql_utils::TextOr(found, 1, "TABLE");
            }
            definition.created = found.TimestampAt(2);
            definition.last_altered = found.TimestampAt(3);
            definition.definition = found.TextAt(4);
            return R::Ok(std::move(definition));
        });
}

} // namespace mssql_mcp
