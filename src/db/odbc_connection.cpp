#include <mssql_mcp/db/odbc_connection.hpp>

#include <mssql_mcp/core/log.hpp>
#include <mssql_mcp/db/text_encoding.hpp>

#ifdef _WIN32
#include <windows.h>
#endif
#include <sql.h>
#include <sqlext.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace mssql_mcp {

namespace {

constexpr const char* kLogComponent = "odbc";
constexpr std::size_t kChunkSize = 8192;
constexpr std::size_t kMaxNvarcharLength = 4000;

static_assert(sizeof(SQLWCHAR) == sizeof(char16_t),
              "ODBC wide characters must be UTF-16 code units");

std::vector<SQLWCHAR> ToSqlWide(std::string_view utf8) {
    const auto utf16 = Utf8ToUtf16(utf8);
    std::vector<SQLWCHAR> wide(utf16.begin(), utf16.end());
    wide.push_back(0);
    return wide;
}

std::string FromSqlWide(const SQLWCHAR* text, std::size_t length) {
    return Utf16ToUtf8(std::u16string(text, text + length));
}

// ---------------------------------------------------------------------------
// OdbcHandle: owns one SQLHANDLE and frees it on destruction.
// ---------------------------------------------------------------------------
class OdbcHandle {
public:
    explicit OdbcHandle(SQLSMALLINT type) : type_(type) {}

    ~OdbcHandle() {
        if (handle_ != SQL_NULL_HANDLE) {
            SQLFreeHandle(type_, handle_);
        }
    }

    OdbcHandle(const OdbcHandle&) = delete;
    OdbcHandle& operator=(const OdbcHandle&) = delete;
    OdbcHandle(OdbcHandle&&) = delete;
    OdbcHandle& operator=(OdbcHandle&&) = delete;

    [[nodiscard]] SQLHANDLE Get() const noexcept { return handle_; }
    [[nodiscard]] SQLHANDLE* Out() noexcept { return &handle_; }
    [[nodiscard]] SQLSMALLINT Type() const noexcept { return type_; }

private:
    SQLSMALLINT type_;
    SQLHANDLE handle_ = SQL_NULL_HANDLE;
};

// Driver messages arrive as "[vendor][driver][SQL Server]text"; callers only
// want the text.
std::string StripVendorPrefix(const std::string& message) {
    std::size_t pos = 0;
    while (pos < message.size() && message[pos] == '[') {
        auto close = message.find(']', pos);
        if (close == std::string::npos) break;
        pos = close + 1;
    }
    return message.substr(pos);
}

// Collect every diagnostic record on a handle into one Error. The first
// record decides SQLSTATE and native code; messages are joined by newlines.
Error DiagnosticError(const std::string& operation, SQLSMALLINT handle_type,
                      SQLHANDLE handle) {
    std::string first_state;
    int first_native = 0;
    std::string joined;

    for (SQLSMALLINT rec = 1;; ++rec) {
        SQLWCHAR state[6] = {0};
        SQLINTEGER native = 0;
        std::vector<SQLWCHAR> text(4096);
        SQLSMALLINT text_len = 0;
        auto rc = SQLGetDiagRecW(handle_type, handle, rec, state, &native,
                                 text.data(),
                                 static_cast<SQLSMALLINT>(text.size()),
                                 &text_len);
        if (!SQL_SUCCEEDED(rc)) break;

        auto len = std::min<std::size_t>(static_cast<std::size_t>(text_len),
                                         text.size() - 1);
        std::string message = FromSqlWide(text.data(), len);
        if (rec == 1) {
            first_state = FromSqlWide(state, 5);
            first_native = static_cast<int>(native);
        }
        if (!joined.empty()) joined += '\n';
        joined += StripVendorPrefix(message);
    }

    if (joined.empty()) {
        joined = operation + " failed without driver diagnostics";
    }
    return Error::FromSqlState(operation, first_state, first_native, joined);
}

// Connect-phase failures are connection failures whatever SQLSTATE the
// driver chose, except an expired login timeout.
Error AsConnectionError(Error error) {
    if (error.category != ErrorCategory::Timeout) {
        error.category = ErrorCategory::ConnectionFailed;
    }
    return error;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string TrimSpaces(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Connection strings are "key=value" pairs separated by ';'. A value wrapped
// in braces may contain ';' and '=', with "}}" standing for a literal '}'.
bool HasAttribute(const std::string& connection_string, const std::string& key) {
    const auto wanted = ToLower(key);
    std::size_t pos = 0;
    while (pos < connection_string.size()) {
        const auto delim = connection_string.find_first_of("=;", pos);
        if (delim == std::string::npos) break;
        if (connection_string[delim] == ';') {
            pos = delim + 1;
            continue;
        }
        if (ToLower(TrimSpaces(connection_string.substr(pos, delim - pos))) == wanted) {
            return true;
        }

        // Skip the value.
        pos = delim + 1;
        while (pos < connection_string.size() && connection_string[pos] == ' ') ++pos;
        if (pos < connection_string.size() && connection_string[pos] == '{') {
            ++pos;
            while (pos < connection_string.size()) {
                if (connection_string[pos] == '}') {
                    if (pos + 1 < connection_string.size() &&
                        connection_string[pos + 1] == '}') {
                        pos += 2;
                        continue;
                    }
                    ++pos;
                    break;
                }
                ++pos;
            }
        }
        const auto end = connection_string.find(';', pos);
        if (end == std::string::npos) break;
        pos = end + 1;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Statement preparation shared by queries and non-queries.
// ---------------------------------------------------------------------------
struct BoundParams {
    std::vector<TextParameter> values;
    std::vector<SQLLEN> lengths;
};

Result<void, Error> PrepareStatement(SQLHSTMT stmt, const SqlParams& params,
                                     BoundParams& bound,
                                     std::chrono::seconds timeout) {
    auto rc = SQLSetStmtAttr(
        stmt, SQL_ATTR_QUERY_TIMEOUT,
        reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(
            std::max<std::int64_t>(0, timeout.count()))),
        0);
    if (!SQL_SUCCEEDED(rc)) {
        return Result<void, Error>::Err(
            DiagnosticError("SetQueryTimeout", SQL_HANDLE_STMT, stmt));
    }

    // Bound buffers must stay put until the statement is released.
    bound.values.clear();
    bound.values.reserve(params.size());
    for (const auto& param : params) {
        bound.values.push_back(MakeTextParameter(param));
    }
    bound.lengths.assign(params.size(), 0);
    for (std::size_t i = 0; i < bound.values.size(); ++i) {
        auto& value = bound.values[i];
        const auto bytes = static_cast<SQLLEN>(value.data.size() * sizeof(SQLWCHAR));
        bound.lengths[i] = bytes;
        rc = SQLBindParameter(
            stmt, static_cast<SQLUSMALLINT>(i + 1), SQL_PARAM_INPUT,
            static_cast<SQLSMALLINT>(value.c_type),
            static_cast<SQLSMALLINT>(value.sql_type),
            static_cast<SQLULEN>(value.column_size), 0,
            const_cast<char16_t*>(value.data.data()), bytes, &bound.lengths[i]);
        if (!SQL_SUCCEEDED(rc)) {
            return Result<void, Error>::Err(
                DiagnosticError("BindParameter", SQL_HANDLE_STMT, stmt));
        }
    }
    return Result<void, Error>::Ok();
}

SQLRETURN ExecDirect(SQLHSTMT stmt, std::string_view sql) {
    auto text = ToSqlWide(sql);
    return SQLExecDirectW(stmt, text.data(), SQL_NTS);
}

// ---------------------------------------------------------------------------
// ActiveStatement: the statement a concurrent Cancel() may interrupt. Once
// cancel_requested is set the connection starts no further work.
// ---------------------------------------------------------------------------
struct ActiveStatement {
    std::mutex mutex;
    SQLHSTMT stmt = SQL_NULL_HSTMT;
    bool cancel_requested = false;
};

// Publishes a statement handle to Cancel() for its lifetime. Must be
// destroyed before the handle is freed.
class StatementRegistration {
public:
    StatementRegistration(std::shared_ptr<ActiveStatement> slot, SQLHSTMT stmt)
        : slot_(std::move(slot)) {
        std::lock_guard<std::mutex> lock(slot_->mutex);
        slot_->stmt = stmt;
    }

    ~StatementRegistration() {
        if (slot_) {
            std::lock_guard<std::mutex> lock(slot_->mutex);
            slot_->stmt = SQL_NULL_HSTMT;
        }
    }

    StatementRegistration(StatementRegistration&& other) noexcept
        : slot_(std::move(other.slot_)) {}
    StatementRegistration& operator=(StatementRegistration&&) = delete;
    StatementRegistration(const StatementRegistration&) = delete;
    StatementRegistration& operator=(const StatementRegistration&) = delete;

    [[nodiscard]] bool CancelRequested() const {
        std::lock_guard<std::mutex> lock(slot_->mutex);
        return slot_->cancel_requested;
    }

private:
    std::shared_ptr<ActiveStatement> slot_;
};

// ---------------------------------------------------------------------------
// OdbcRowCursor
// ---------------------------------------------------------------------------
class OdbcRowCursor : public IRowCursor {
public:
    OdbcRowCursor(std::unique_ptr<OdbcHandle> stmt, StatementRegistration registration,
                  BoundParams bound, std::vector<ColumnInfo> columns)
        : stmt_(std::move(stmt)),
          registration_(std::move(registration)),
          bound_(std::move(bound)),
          columns_(std::move(columns)) {}

    [[nodiscard]] const std::vector<ColumnInfo>& Columns() const override {
        return columns_;
    }

    [[nodiscard]] Result<std::optional<Row>, Error> Next() override {
        using R = Result<std::optional<Row>, Error>;
        if (columns_.empty() || finished_) {
            return R::Ok(std::nullopt);
        }
        if (registration_.CancelRequested()) {
            return R::Err(Error::CancelledError("Fetch"));
        }

        auto rc = SQLFetch(stmt_->Get());
        if (rc == SQL_NO_DATA) {
            finished_ = true;
            return R::Ok(std::nullopt);
        }
        if (!SQL_SUCCEEDED(rc)) {
            return R::Err(DiagnosticError("Fetch", SQL_HANDLE_STMT, stmt_->Get()));
        }

        Row row;
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            auto cell = ReadCell(static_cast<SQLUSMALLINT>(i + 1),
                                 columns_[i].sql_type);
            if (cell.IsErr()) {
                return R::Err(std::move(cell).Error());
            }
            row.Add(columns_[i].name, std::move(cell).Value());
        }
        return R::Ok(std::optional<Row>(std::move(row)));
    }

private:
    Result<SqlValue, Error> ReadCell(SQLUSMALLINT col, int sql_type) {
        using R = Result<SqlValue, Error>;
        SQLHSTMT stmt = stmt_->Get();
        SQLLEN indicator = 0;

        switch (sql_type) {
            case SQL_BIT: {
                unsigned char value = 0;
                auto rc = SQLGetData(stmt, col, SQL_C_BIT, &value, sizeof(value), &indicator);
                if (!SQL_SUCCEEDED(rc)) {
                    return R::Err(DiagnosticError("GetData", SQL_HANDLE_STMT, stmt));
                }
                if (indicator == SQL_NULL_DATA) return R::Ok(SqlValue::Null());
                return R::Ok(SqlValue::Boolean(value != 0));
            }
            case SQL_TINYINT:
            case SQL_SMALLINT:
            case SQL_INTEGER:
            case SQL_BIGINT: {
                SQLBIGINT value = 0;
                auto rc = SQLGetData(stmt, col, SQL_C_SBIGINT, &value, sizeof(value), &indicator);
                if (!SQL_SUCCEEDED(rc)) {
                    return R::Err(DiagnosticError("GetData", SQL_HANDLE_STMT, stmt));
                }
                if (indicator == SQL_NULL_DATA) return R::Ok(SqlValue::Null());
                return R::Ok(SqlValue::Integer(static_cast<std::int64_t>(value)));
            }
            case SQL_DECIMAL:
            case SQL_NUMERIC: {
                // Exact digits; money arrives here too.
                auto text = ReadChunked(col, SQL_C_CHAR);
                if (text.IsErr() || text.Value().IsNull()) return text;
                return R::Ok(DecimalFromText(text.Value().AsText()));
            }
            case SQL_REAL:
            case SQL_FLOAT:
            case SQL_DOUBLE: {
                double value = 0;
                auto rc = SQLGetData(stmt, col, SQL_C_DOUBLE, &value, sizeof(value), &indicator);
                if (!SQL_SUCCEEDED(rc)) {
                    return R::Err(DiagnosticError("GetData", SQL_HANDLE_STMT, stmt));
                }
                if (indicator == SQL_NULL_DATA) return R::Ok(SqlValue::Null());
                return R::Ok(SqlValue::Floating(value));
            }
            case SQL_TYPE_DATE:
            case SQL_TYPE_TIMESTAMP: {
                SQL_TIMESTAMP_STRUCT ts{};
                auto rc = SQLGetData(stmt, col, SQL_C_TYPE_TIMESTAMP, &ts, sizeof(ts), &indicator);
                if (!SQL_SUCCEEDED(rc)) {
                    return R::Err(DiagnosticError("GetData", SQL_HANDLE_STMT, stmt));
                }
                if (indicator == SQL_NULL_DATA) return R::Ok(SqlValue::Null());
                SqlTimestamp value;
                value.year = ts.year;
                value.month = ts.month;
                value.day = ts.day;
                value.hour = ts.hour;
                value.minute = ts.minute;
                value.second = ts.second;
                value.fraction_ns = static_cast<std::uint32_t>(ts.fraction);
                return R::Ok(SqlValue::Timestamp(value));
            }
            case SQL_BINARY:
            case SQL_VARBINARY:
            case SQL_LONGVARBINARY:
                return ReadChunked(col, SQL_C_BINARY);
            default:
                return ReadChunked(col, SQL_C_WCHAR);
        }
    }

    // Variable-length data of any size: SQLGetData is called until the
    // driver stops reporting truncation (01004). Wide text is converted to
    // UTF-8; SQL_C_CHAR is only used for ASCII renderings such as decimals.
    Result<SqlValue, Error> ReadChunked(SQLUSMALLINT col, SQLSMALLINT c_type) {
        using R = Result<SqlValue, Error>;
        SQLHSTMT stmt = stmt_->Get();
        std::size_t terminator = 0;
        if (c_type == SQL_C_CHAR) terminator = 1;
        if (c_type == SQL_C_WCHAR) terminator = sizeof(SQLWCHAR);
        const std::size_t usable = kChunkSize - terminator;

        std::vector<char> buffer(kChunkSize);
        std::string data;
        for (;;) {
            SQLLEN indicator = 0;
            auto rc = SQLGetData(stmt, col, c_type, buffer.data(),
                                 static_cast<SQLLEN>(buffer.size()), &indicator);
            if (rc == SQL_NO_DATA) break;
            if (!SQL_SUCCEEDED(rc)) {
                return R::Err(DiagnosticError("GetData", SQL_HANDLE_STMT, stmt));
            }
            if (indicator == SQL_NULL_DATA) {
                return R::Ok(SqlValue::Null());
            }
            std::size_t chunk = usable;
            if (indicator != SQL_NO_TOTAL &&
                static_cast<std::size_t>(indicator) < usable) {
                chunk = static_cast<std::size_t>(indicator);
            }
            data.append(buffer.data(), chunk);
            if (rc == SQL_SUCCESS) break;
        }

        if (c_type == SQL_C_WCHAR) {
            std::u16string wide(data.size() / sizeof(char16_t), u'\0');
            std::memcpy(wide.data(), data.data(), wide.size() * sizeof(char16_t));
            return R::Ok(SqlValue::Text(Utf16ToUtf8(wide)));
        }
        if (c_type == SQL_C_CHAR) {
            return R::Ok(SqlValue::Text(std::move(data)));
        }
        return R::Ok(SqlValue::Binary(SqlBinary(data.begin(), data.end())));
    }

    std::unique_ptr<OdbcHandle> stmt_;
    StatementRegistration registration_;  // released before stmt_
    BoundParams bound_;
    std::vector<ColumnInfo> columns_;
    bool finished_ = false;
};

// Advance past row counts (INSERT/UPDATE, SET NOCOUNT OFF chatter) to the
// first result set that has columns. Returns an empty list when the batch
// produces none.
Result<std::vector<ColumnInfo>, Error> DescribeFirstResultSet(SQLHSTMT stmt) {
    using R = Result<std::vector<ColumnInfo>, Error>;
    for (;;) {
        SQLSMALLINT count = 0;
        auto rc = SQLNumResultCols(stmt, &count);
        if (!SQL_SUCCEEDED(rc)) {
            return R::Err(DiagnosticError("NumResultCols", SQL_HANDLE_STMT, stmt));
        }
        if (count > 0) {
            std::vector<ColumnInfo> columns;
            columns.reserve(static_cast<std::size_t>(count));
            for (SQLSMALLINT i = 1; i <= count; ++i) {
                SQLWCHAR name[1024] = {0};
                SQLSMALLINT name_len = 0;
                SQLSMALLINT data_type = 0;
                SQLULEN column_size = 0;
                SQLSMALLINT decimal_digits = 0;
                SQLSMALLINT nullable = 0;
                rc = SQLDescribeColW(stmt, static_cast<SQLUSMALLINT>(i), name,
                                     static_cast<SQLSMALLINT>(std::size(name)),
                                     &name_len, &data_type, &column_size,
                                     &decimal_digits, &nullable);
                if (!SQL_SUCCEEDED(rc)) {
                    return R::Err(DiagnosticError("DescribeCol", SQL_HANDLE_STMT, stmt));
                }
                const auto len = std::min<std::size_t>(
                    static_cast<std::size_t>(std::max<SQLSMALLINT>(0, name_len)),
                    std::size(name) - 1);
                columns.push_back(ColumnInfo{FromSqlWide(name, len),
                                             static_cast<int>(data_type)});
            }
            return R::Ok(std::move(columns));
        }

        rc = SQLMoreResults(stmt);
        if (rc == SQL_NO_DATA) {
            return R::Ok(std::vector<ColumnInfo>{});
        }
        if (!SQL_SUCCEEDED(rc)) {
            return R::Err(DiagnosticError("MoreResults", SQL_HANDLE_STMT, stmt));
        }
    }
}

// ---------------------------------------------------------------------------
// OdbcConnection
// ---------------------------------------------------------------------------
class OdbcConnection : public IDbConnection {
public:
    explicit OdbcConnection(std::unique_ptr<OdbcHandle> dbc)
        : dbc_(std::move(dbc)), active_(std::make_shared<ActiveStatement>()) {}

    ~OdbcConnection() override {
        SQLDisconnect(dbc_->Get());
    }

    [[nodiscard]] Result<std::unique_ptr<IRowCursor>, Error> ExecuteQuery(
        std::string_view sql, const SqlParams& params,
        std::chrono::seconds timeout) override {
        using R = Result<std::unique_ptr<IRowCursor>, Error>;

        auto stmt = AllocStatement();
        if (stmt.IsErr()) return R::Err(std::move(stmt).Error());
        auto handle = std::move(stmt).Value();
        StatementRegistration registration(active_, handle->Get());
        if (registration.CancelRequested()) {
            return R::Err(Error::CancelledError("ExecuteQuery"));
        }

        BoundParams bound;
        auto prepared = PrepareStatement(handle->Get(), params, bound, timeout);
        if (prepared.IsErr()) return R::Err(prepared.Error());

        auto rc = ExecDirect(handle->Get(), sql);
        if (!SQL_SUCCEEDED(rc) && rc != SQL_NO_DATA) {
            return R::Err(DiagnosticError("ExecuteQuery", SQL_HANDLE_STMT, handle->Get()));
        }

        std::vector<ColumnInfo> columns;
        if (rc != SQL_NO_DATA) {
            auto described = DescribeFirstResultSet(handle->Get());
            if (described.IsErr()) return R::Err(std::move(described).Error());
            columns = std::move(described).Value();
        }

        std::unique_ptr<IRowCursor> cursor = std::make_unique<OdbcRowCursor>(
            std::move(handle), std::move(registration), std::move(bound),
            std::move(columns));
        return R::Ok(std::move(cursor));
    }

    [[nodiscard]] Result<std::int64_t, Error> ExecuteNonQuery(
        std::string_view sql, const SqlParams& params,
        std::chrono::seconds timeout) override {
        using R = Result<std::int64_t, Error>;

        auto stmt = AllocStatement();
        if (stmt.IsErr()) return R::Err(std::move(stmt).Error());
        auto handle = std::move(stmt).Value();
        StatementRegistration registration(active_, handle->Get());
        if (registration.CancelRequested()) {
            return R::Err(Error::CancelledError("ExecuteNonQuery"));
        }

        BoundParams bound;
        auto prepared = PrepareStatement(handle->Get(), params, bound, timeout);
        if (prepared.IsErr()) return R::Err(prepared.Error());

        auto rc = ExecDirect(handle->Get(), sql);
        if (!SQL_SUCCEEDED(rc) && rc != SQL_NO_DATA) {
            return R::Err(DiagnosticError("ExecuteNonQuery", SQL_HANDLE_STMT, handle->Get()));
        }

        // Errors in later statements of a batch surface from SQLMoreResults.
        std::int64_t total = -1;
        for (;;) {
            SQLLEN count = -1;
            if (SQL_SUCCEEDED(SQLRowCount(handle->Get(), &count)) && count >= 0) {
                total = (total < 0 ? 0 : total) + static_cast<std::int64_t>(count);
            }
            rc = SQLMoreResults(handle->Get());
            if (rc == SQL_NO_DATA) break;
            if (!SQL_SUCCEEDED(rc)) {
                return R::Err(DiagnosticError("ExecuteNonQuery", SQL_HANDLE_STMT, handle->Get()));
            }
        }
        return R::Ok(total);
    }

    // SQLCancel is the one ODBC call allowed on a statement that another
    // thread is executing.
    void Cancel() override {
        std::lock_guard<std::mutex> lock(active_->mutex);
        active_->cancel_requested = true;
        if (active_->stmt == SQL_NULL_HSTMT) {
            return;
        }
        if (!SQL_SUCCEEDED(SQLCancel(active_->stmt))) {
            LogWarn(kLogComponent, "SQLCancel failed: " +
                    DiagnosticError("Cancel", SQL_HANDLE_STMT, active_->stmt).message);
        }
    }

private:
    Result<std::unique_ptr<OdbcHandle>, Error> AllocStatement() {
        using R = Result<std::unique_ptr<OdbcHandle>, Error>;
        auto stmt = std::make_unique<OdbcHandle>(SQL_HANDLE_STMT);
        auto rc = SQLAllocHandle(SQL_HANDLE_STMT, dbc_->Get(), stmt->Out());
        if (!SQL_SUCCEEDED(rc)) {
            return R::Err(DiagnosticError("AllocStatement", SQL_HANDLE_DBC, dbc_->Get()));
        }
        return R::Ok(std::move(stmt));
    }

    std::unique_ptr<OdbcHandle> dbc_;
    std::shared_ptr<ActiveStatement> active_;
};

} // anonymous namespace

std::string ApplyTrustServerCertificate(const std::string& connection_string) {
    if (HasAttribute(connection_string, "TrustServerCertificate")) {
        return connection_string;
    }
    std::string result = connection_string;
    if (!result.empty() && result.back() != ';') {
        result += ';';
    }
    result += "TrustServerCertificate=yes";
    return result;
}

TextParameter MakeTextParameter(const std::string& value) {
    TextParameter param;
    param.c_type = SQL_C_WCHAR;
    param.sql_type = SQL_WVARCHAR;
    param.data = Utf8ToUtf16(value);
    param.column_size = param.data.size() > kMaxNvarcharLength
        ? 0
        : std::max<std::size_t>(1, param.data.size());
    return param;
}

// ---------------------------------------------------------------------------
// OdbcConnectionFactory::Impl: owns the process ODBC environment.
// ---------------------------------------------------------------------------
struct OdbcConnectionFactory::Impl {
    OdbcOptions options;
    OdbcHandle env{SQL_HANDLE_ENV};
    std::optional<Error> init_error;

    explicit Impl(const OdbcOptions& opts) : options(opts) {
        auto rc = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, env.Out());
        if (!SQL_SUCCEEDED(rc)) {
            init_error = Error{"AllocEnvironment",
                               "Failed to allocate ODBC environment handle",
                               std::nullopt, std::nullopt,
                               ErrorCategory::ConnectionFailed};
            return;
        }
        rc = SQLSetEnvAttr(env.Get(), SQL_ATTR_ODBC_VERSION,
                           reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);
        if (!SQL_SUCCEEDED(rc)) {
            init_error = AsConnectionError(
                DiagnosticError("SetOdbcVersion", SQL_HANDLE_ENV, env.Get()));
        }
    }
};

OdbcConnectionFactory::OdbcConnectionFactory(const OdbcOptions& options)
    : impl_(std::make_unique<Impl>(options)) {
    if (impl_->init_error) {
        LogError(kLogComponent, impl_->init_error->ToString());
    }
}

OdbcConnectionFactory::~OdbcConnectionFactory() = default;

Result<std::unique_ptr<IDbConnection>, Error> OdbcConnectionFactory::Open(
    const std::string& connection_string) {
    using R = Result<std::unique_ptr<IDbConnection>, Error>;
    if (impl_->init_error) {
        return R::Err(*impl_->init_error);
    }

    auto dbc = std::make_unique<OdbcHandle>(SQL_HANDLE_DBC);
    auto rc = SQLAllocHandle(SQL_HANDLE_DBC, impl_->env.Get(), dbc->Out());
    if (!SQL_SUCCEEDED(rc)) {
        return R::Err(AsConnectionError(
            DiagnosticError("AllocConnection", SQL_HANDLE_ENV, impl_->env.Get())));
    }

    rc = SQLSetConnectAttr(
        dbc->Get(), SQL_ATTR_LOGIN_TIMEOUT,
        reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(
            std::max<std::int64_t>(0, impl_->options.login_timeout.count()))),
        0);
    if (!SQL_SUCCEEDED(rc)) {
        LogWarn(kLogComponent, "Driver rejected login timeout: " +
                DiagnosticError("SetLoginTimeout", SQL_HANDLE_DBC, dbc->Get()).message);
    }

    const auto effective = impl_->options.trust_server_certificate
        ? ApplyTrustServerCertificate(connection_string)
        : connection_string;

    auto text = ToSqlWide(effective);
    rc = SQLDriverConnectW(dbc->Get(), nullptr, text.data(), SQL_NTS,
                           nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(rc)) {
        return R::Err(AsConnectionError(
            DiagnosticError("Connect", SQL_HANDLE_DBC, dbc->Get())));
    }

    std::unique_ptr<IDbConnection> connection =
        std::make_unique<OdbcConnection>(std::move(dbc));
    return R::Ok(std::move(connection));
}

} // namespace mssql_mcp
