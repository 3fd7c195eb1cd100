#include <mssql_mcp/sql/schema.hpp>

#include "sql_utils.hpp"

#include <string>

namespace mssql_mcp {

namespace {

constexpr const char* kListTablesSql =
    "SELECT TABLE_SCHEMA, TABLE_NAME, TABLE_TYPE"
    " FROM INFORMATION_SCHEMA.TABLES"
    " WHERE TABLE_TYPE = 'BASE TABLE'";

// Parameters: schema, table (primary-key subquery), schema, table (outer).
constexpr const char* kDescribeTableSql =
    "SELECT c.COLUMN_NAME, c.DATA_TYPE, c.CHARACTER_MAXIMUM_LENGTH,"
    " c.NUMERIC_PRECISION, c.NUMERIC_SCALE, c.IS_NULLABLE, c.COLUMN_DEFAULT,"
    " CASE WHEN pk.COLUMN_NAME IS NOT NULL THEN 'YES' ELSE 'NO' END AS IS_PRIMARY_KEY"
    " FROM INFORMATION_SCHEMA.COLUMNS c"
    " LEFT JOIN ("
    "   SELECT ku.COLUMN_NAME"
    "   FROM INFORMATION_SCHEMA.TABLE_CONSTRAINTS tc"
    "   JOIN INFORMATION_SCHEMA.KEY_COLUMN_USAGE ku"
    "     ON tc.CONSTRAINT_NAME = ku.CONSTRAINT_NAME"
    "     AND tc.TABLE_SCHEMA = ku.TABLE_SCHEMA"
    "     AND tc.TABLE_NAME = ku.TABLE_NAME"
    "   WHERE tc.CONSTRAINT_TYPE = 'PRIMARY KEY'"
    "     AND tc.TABLE_SCHEMA = ?"
    "     AND tc.TABLE_NAME = ?"
    " ) pk ON c.COLUMN_NAME = pk.COLUMN_NAME"
    " WHERE c.TABLE_SCHEMA = ?"
    "   AND c.TABLE_NAME = ?"
    " ORDER BY c.ORDINAL_POSITION";

constexpr const char* kListDatabasesSql =
    "SELECT name, database_id, create_date, state_desc, recovery_model_desc"
    " FROM sys.databases"
    " WHERE name NOT IN ('master', 'tempdb', 'model', 'msdb')"
    " ORDER BY name";

} // anonymous namespace

// ---------------------------------------------------------------------------
// ListTables
// ---------------------------------------------------------------------------
Result<std::vector<TableInfo>, Error> ListTables(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::optional<std::string>& schema,
    const CancellationToken& cancel) {
    std::string sql = kListTablesSql;
    SqlParams params;
    sql_utils::AppendSchemaFilter(sql, params, "TABLE_SCHEMA", schema);
    sql += " ORDER BY TABLE_SCHEMA, TABLE_NAME";

    return sql_utils::FetchAll(factory, connection_string, sql, params, cancel)
        .Map([](const std::vector<Row>& rows) {
            std::vector<TableInfo> tables;
            tables.reserve(rows.size());
            for (const auto& row : rows) {
                tables.push_back(TableInfo{sql_utils::TextOr(row, 0),
                                           sql_utils::TextOr(row, 1),
                                           sql_utils::TextOr(row, 2)});
            }
            return tables;
        });
}

// ---------------------------------------------------------------------------
// DescribeTable
// ---------------------------------------------------------------------------
std::string FormatDataType(const std::string& type,
                           std::optional<std::int64_t> char_length,
                           std::optional<std::int64_t> numeric_precision,
                           std::optional<std::int64_t> numeric_scale) {
    if (char_length.has_value() && *char_length > 0) {
        return type + "(" + std::to_string(*char_length) + ")";
    }
    if (numeric_precision.has_value() && numeric_scale.has_value()) {
        return type + "(" + std::to_string(*numeric_precision) + "," +
               std::to_string(*numeric_scale) + ")";
    }
    return type;
}

Result<TableDescription, Error> DescribeTable(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const std::string& schema,
    const std::string& table_name,
    const CancellationToken& cancel) {
    using R = Result<TableDescription, Error>;

    SqlParams params{schema, table_name, schema, table_name};
    auto rows = sql_utils::FetchAll(factory, connection_string,
                                    kDescribeTableSql, params, cancel);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }

    TableDescription description;
    description.schema = schema;
    description.table_name = table_name;
    description.columns.reserve(rows.Value().size());
    for (const auto& row : rows.Value()) {
        ColumnDescription column;
        column.name = sql_utils::TextOr(row, 0);
        column.data_type = FormatDataType(sql_utils::TextOr(row, 1),
                                          row.IntegerAt(2),
                                          row.IntegerAt(3),
                                          row.IntegerAt(4));
        column.nullable = sql_utils::TextOr(row, 5) == "YES";
        column.default_value = row.TextAt(6);
        column.is_primary_key = sql_utils::TextOr(row, 7) == "YES";
        description.columns.push_back(std::move(column));
    }
    return R::Ok(std::move(description));
}

// ---------------------------------------------------------------------------
// ListDatabases
// ---------------------------------------------------------------------------
Result<std::vector<DatabaseInfo>, Error> ListDatabases(
    IConnectionFactory& factory,
    const std::string& connection_string,
    const CancellationToken& cancel) {
    return sql_utils::FetchAll(factory, connection_string, kListDatabasesSql, {}, cancel)
        .Map([](const std::vector<Row>& rows) {
            std::vector<DatabaseInfo> databases;
            databases.reserve(rows.size());
            for (const auto& row : rows) {
                DatabaseInfo db;
                db.name = sql_utils::TextOr(row, 0);
                db.database_id = row.IntegerAt(1).value_or(0);
                db.create_date = row.TimestampAt(2);
                db.state = sql_utils::TextOr(row, 3);
                db.recovery_model = sql_utils::TextOr(row, 4);
                databases.push_back(std::move(db));
            }
            return databases;
        });
}

} // namespace mssql_mcp
