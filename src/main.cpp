#include <mssql_mcp/config/config_loader.hpp>
#include <mssql_mcp/core/log.hpp>
#include <mssql_mcp/core/terminal.hpp>
#include <mssql_mcp/core/version.hpp>
#include <mssql_mcp/db/odbc_connection.hpp>
#include <mssql_mcp/mcp/mcp_server.hpp>
#include <mssql_mcp/mcp/mcp_tool_handlers.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig  = 2;

constexpr const char* kLogComponent = "main";

// Resolve CLI + YAML into one validated config.
mssql_mcp::Result<mssql_mcp::AppConfig, std::string> ResolveConfig(
    const mssql_mcp::CliOptions& cli) {
    using namespace mssql_mcp;
    using R = Result<AppConfig, std::string>;

    AppConfig base;
    if (cli.config_path.has_value()) {
        auto loaded = LoadFromYaml(*cli.config_path);
        if (loaded.IsErr()) {
            return R::Err(*cli.config_path + ": " + loaded.Error());
        }
        base = std::move(loaded).Value();
    }

    auto merged = MergeConfigs(base, cli.overrides);
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return R::Ok(std::move(merged));
}

// Logs go to stderr or a file; stdout is the protocol channel.
bool InitLogging(const mssql_mcp::AppConfig& config) {
    using namespace mssql_mcp;

    const bool json = config.log_format == "json";
    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file, json);
        if (!sink->IsOpen()) {
            std::cerr << "Error: cannot open log file " << *config.log_file << "\n";
            return false;
        }
        InitGlobalLogger(std::move(sink), config.log_level);
        return true;
    }

    if (json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log_level);
    } else {
        InitGlobalLogger(
            std::make_unique<ColorConsoleSink>(ResolveLogColor(config.color)),
            config.log_level);
    }
    return true;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mssql_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "Error: " << cli.Error() << "\n";
        return kExitConfig;
    }
    if (cli.Value().show_version) {
        std::cout << "mssql-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config = ResolveConfig(cli.Value());
    if (config.IsErr()) {
        std::cerr << "Error: " << config.Error() << "\n";
        return kExitConfig;
    }
    if (!InitLogging(config.Value())) {
        return kExitConfig;
    }

    const auto& odbc = config.Value().odbc;
    if (odbc.trust_server_certificate) {
        LogWarn(kLogComponent,
                "TrustServerCertificate=yes is added to connection strings that "
                "do not set it: server certificates are accepted without chain "
                "or host name verification");
    }

    OdbcConnectionFactory factory(odbc);

    ToolRegistry registry;
    RegisterSqlTools(registry, factory);

    LogInfo(kLogComponent, std::string("mssql-mcp ") + kVersion + " starting");

    // Blocks until EOF on stdin.
    McpServer server(std::move(registry));
    server.Run();

    LogInfo(kLogComponent, "Stopped");
    return kExitSuccess;
}
