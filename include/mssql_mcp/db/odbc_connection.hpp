#pragma once

#include <mssql_mcp/db/i_db_connection.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace mssql_mcp {

// ---------------------------------------------------------------------------
// OdbcOptions: connection-layer settings shared by every Open().
// ---------------------------------------------------------------------------
struct OdbcOptions {
    std::chrono::seconds login_timeout{15};

    // Opt-in TLS downgrade: the driver accepts any server certificate
    // (chain and host name are not verified). Only connection strings that
    // do not already set TrustServerCertificate are changed.
    bool trust_server_certificate = false;
};

/// Append "TrustServerCertificate=yes" unless the connection string already
/// sets the TrustServerCertificate attribute. Only attribute keys count: the
/// key is matched case-insensitively, ignoring surrounding spaces, and text
/// inside a value (including a {braced} value holding ';') never matches.
std::string ApplyTrustServerCertificate(const std::string& connection_string);

// ---------------------------------------------------------------------------
// TextParameter: how one '?' value is handed to SQLBindParameter.
//
// Values are sent as UTF-16 (SQL_C_WCHAR) typed nvarchar (SQL_WVARCHAR), so
// names compare against the nvarchar catalog columns without passing through
// the database code page. column_size is in UTF-16 units; 0 asks the driver
// for nvarchar(max), used above the 4000-unit nvarchar limit.
// ---------------------------------------------------------------------------
struct TextParameter {
    int c_type = 0;
    int sql_type = 0;
    std::u16string data;
    std::size_t column_size = 0;
};

[[nodiscard]] TextParameter MakeTextParameter(const std::string& value);

// ---------------------------------------------------------------------------
// OdbcConnectionFactory: IConnectionFactory over the ODBC driver manager
// (unixODBC on Linux, the Windows driver manager elsewhere). Connection
// strings are handed to SQLDriverConnect unparsed, e.g.
//   Driver={ODBC Driver 18 for SQL Server};Server=tcp:db,1433;Database=app;UID=sa;PWD=...
//
// Holds one ODBC environment handle for the process; each Open() allocates a
// fresh connection handle that is disconnected and freed when the returned
// IDbConnection is destroyed. No pooling.
// ---------------------------------------------------------------------------
class OdbcConnectionFactory : public IConnectionFactory {
public:
    explicit OdbcConnectionFactory(const OdbcOptions& options = {});
    ~OdbcConnectionFactory() override;

    [[nodiscard]] Result<std::unique_ptr<IDbConnection>, Error> Open(
        const std::string& connection_string) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mssql_mcp
