#pragma once

#include <mssql_mcp/core/log.hpp>
#include <mssql_mcp/db/odbc_connection.hpp>

#include <optional>
#include <string>

namespace mssql_mcp {

struct AppConfig {
    OdbcOptions odbc;
    LogLevel log_level = LogLevel::Warn;
    std::optional<std::string> log_file;
    std::string log_format = "text";  // "text" or "json"
    std::optional<bool> color;        // unset: decided by terminal/NO_COLOR
};

// Values given explicitly on the command line. Unset fields leave the
// YAML (or default) value in place.
struct ConfigOverrides {
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    std::optional<std::string> log_format;
    std::optional<bool> color;
    std::optional<int> login_timeout_seconds;
    std::optional<bool> trust_server_certificate;
};

struct CliOptions {
    std::optional<std::string> config_path;
    ConfigOverrides overrides;
    bool show_version = false;
};

} // namespace mssql_mcp
