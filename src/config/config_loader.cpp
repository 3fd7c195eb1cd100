#include <mssql_mcp/config/config_loader.hpp>

#include <mssql_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <stdexcept>

namespace mssql_mcp {

namespace {

using ConfigResult = Result<AppConfig, std::string>;

bool IsKnownLogFormat(const std::string& format) {
    return format == "text" || format == "json";
}

Result<LogLevel, std::string> LogLevelFromString(const std::string& text,
                                                 const std::string& source) {
    auto level = ParseLogLevel(text);
    if (!level.has_value()) {
        return Result<LogLevel, std::string>::Err(
            "Invalid " + source + " '" + text +
            "' (expected debug, info, warn or error)");
    }
    return Result<LogLevel, std::string>::Ok(*level);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, std::string> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return ConfigResult::Err("Failed to parse YAML file: " + std::string(e.what()));
    }

    AppConfig config;
    if (root.IsNull()) {
        return ConfigResult::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return ConfigResult::Err("Config file must contain a mapping at the top level");
    }

    try {
        // -- Logging --
        if (root["log_level"]) {
            auto level = LogLevelFromString(root["log_level"].as<std::string>(), "log_level");
            if (level.IsErr()) {
                return ConfigResult::Err(level.Error());
            }
            config.log_level = level.Value();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_format"]) {
            config.log_format = root["log_format"].as<std::string>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }

        // -- ODBC --
        if (root["odbc"]) {
            const auto& odbc = root["odbc"];
            if (odbc["login_timeout"]) {
                config.odbc.login_timeout =
                    std::chrono::seconds(odbc["login_timeout"].as<int>());
            }
            if (odbc["trust_server_certificate"]) {
                config.odbc.trust_server_certificate =
                    odbc["trust_server_certificate"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        return ConfigResult::Err("Invalid value in config file: " + std::string(e.what()));
    }

    return ConfigResult::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, std::string> LoadFromCli(int argc, const char* const* argv) {
    using R = Result<CliOptions, std::string>;

    // Only --help is built in; -v is taken by verbosity.
    argparse::ArgumentParser program("mssql-mcp", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP server exposing SQL Server query and catalog tools over stdio.");

    int verbosity = 0;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn, error");
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--log-format")
        .help("Log line format: text or json");
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--login-timeout")
        .help("ODBC login timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--trust-server-certificate")
        .help("Accept any server TLS certificate (no chain or host name check)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return R::Err("CLI parse error: " + std::string(e.what()));
    }

    CliOptions cli;
    cli.show_version = program.get<bool>("--version");

    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }

    auto& o = cli.overrides;
    if (verbosity >= 2) {
        o.log_level = LogLevel::Debug;
    } else if (verbosity == 1) {
        o.log_level = LogLevel::Info;
    }
    // An explicit level wins over -v.
    if (auto val = program.present("--log-level")) {
        auto level = LogLevelFromString(*val, "--log-level");
        if (level.IsErr()) {
            return R::Err(level.Error());
        }
        o.log_level = level.Value();
    }
    if (auto val = program.present("--log-file")) {
        o.log_file = *val;
    }
    if (auto val = program.present("--log-format")) {
        o.log_format = *val;
    }

    const bool color = program.get<bool>("--color");
    const bool no_color = program.get<bool>("--no-color");
    if (color && no_color) {
        return R::Err("--color and --no-color are mutually exclusive");
    }
    if (color) {
        o.color = true;
    } else if (no_color) {
        o.color = false;
    }

    if (auto val = program.present<int>("--login-timeout")) {
        o.login_timeout_seconds = *val;
    }
    if (program.get<bool>("--trust-server-certificate")) {
        o.trust_server_certificate = true;
    }

    return R::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides) {
    AppConfig merged = base;

    if (overrides.log_level.has_value()) {
        merged.log_level = *overrides.log_level;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (overrides.log_format.has_value()) {
        merged.log_format = *overrides.log_format;
    }
    if (overrides.color.has_value()) {
        merged.color = overrides.color;
    }
    if (overrides.login_timeout_seconds.has_value()) {
        merged.odbc.login_timeout = std::chrono::seconds(*overrides.login_timeout_seconds);
    }
    if (overrides.trust_server_certificate.has_value()) {
        merged.odbc.trust_server_certificate = *overrides.trust_server_certificate;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, std::string> ValidateConfig(const AppConfig& config) {
    if (config.odbc.login_timeout.count() < 0) {
        return Result<void, std::string>::Err(
            "Invalid login timeout: " + std::to_string(config.odbc.login_timeout.count()));
    }
    if (!IsKnownLogFormat(config.log_format)) {
        return Result<void, std::string>::Err(
            "Invalid log format '" + config.log_format + "' (expected text or json)");
    }
    if (config.log_file.has_value() && config.log_file->empty()) {
        return Result<void, std::string>::Err("Log file path is empty");
    }
    return Result<void, std::string>::Ok();
}

} // namespace mssql_mcp
