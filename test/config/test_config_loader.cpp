#include <catch2/catch_test_macros.hpp>

#include <mssql_mcp/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace mssql_mcp;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the source tree from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliOptions, std::string> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "mssql-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.log_level == LogLevel::Debug);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/var/log/mssql-mcp.log");
    CHECK(config.log_format == "json");
    CHECK(config.color == std::optional<bool>(false));
    CHECK(config.odbc.login_timeout == std::chrono::seconds(5));
    CHECK(config.odbc.trust_server_certificate);
}

TEST_CASE("LoadFromYaml: missing keys keep defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.log_level == LogLevel::Info);
    CHECK_FALSE(config.log_file.has_value());
    CHECK(config.log_format == "text");
    CHECK_FALSE(config.color.has_value());
    CHECK(config.odbc.login_timeout == std::chrono::seconds(15));
    CHECK_FALSE(config.odbc.trust_server_certificate);
}

TEST_CASE("LoadFromYaml: empty file yields defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("empty_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == LogLevel::Warn);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: top level must be a mapping", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("not_a_map.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("mapping") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_log_level.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("Invalid log_level 'verbose'") != std::string::npos);
}

TEST_CASE("LoadFromYaml: wrongly typed value", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_type.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("Invalid value in config file") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.show_version);
    CHECK_FALSE(cli.overrides.log_level.has_value());
    CHECK_FALSE(cli.overrides.color.has_value());
    CHECK_FALSE(cli.overrides.trust_server_certificate.has_value());
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseArgs({"--config", "/etc/mssql-mcp.yaml",
                             "--log-level", "error",
                             "--log-file", "/tmp/mcp.log",
                             "--log-format", "json",
                             "--no-color",
                             "--login-timeout", "3",
                             "--trust-server-certificate"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == std::optional<std::string>("/etc/mssql-mcp.yaml"));
    const auto& o = cli.overrides;
    CHECK(o.log_level == std::optional<LogLevel>(LogLevel::Error));
    CHECK(o.log_file == std::optional<std::string>("/tmp/mcp.log"));
    CHECK(o.log_format == std::optional<std::string>("json"));
    CHECK(o.color == std::optional<bool>(false));
    CHECK(o.login_timeout_seconds == std::optional<int>(3));
    CHECK(o.trust_server_certificate == std::optional<bool>(true));
}

TEST_CASE("LoadFromCli: short config flag", "[config][cli]") {
    auto result = ParseArgs({"-c", "local.yaml"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().config_path == std::optional<std::string>("local.yaml"));
}

TEST_CASE("LoadFromCli: verbosity count", "[config][cli]") {
    auto one = ParseArgs({"-v"});
    REQUIRE(one.IsOk());
    CHECK(one.Value().overrides.log_level == std::optional<LogLevel>(LogLevel::Info));

    auto two = ParseArgs({"-v", "-v"});
    REQUIRE(two.IsOk());
    CHECK(two.Value().overrides.log_level == std::optional<LogLevel>(LogLevel::Debug));

    auto combined = ParseArgs({"-vv"});
    REQUIRE(combined.IsOk());
    CHECK(combined.Value().overrides.log_level == std::optional<LogLevel>(LogLevel::Debug));
}

TEST_CASE("LoadFromCli: explicit level wins over -v", "[config][cli]") {
    auto result = ParseArgs({"-vv", "--log-level", "warn"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().overrides.log_level == std::optional<LogLevel>(LogLevel::Warn));
}

TEST_CASE("LoadFromCli: invalid log level", "[config][cli]") {
    auto result = ParseArgs({"--log-level", "loud"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("Invalid --log-level 'loud'") != std::string::npos);
}

TEST_CASE("LoadFromCli: color flags", "[config][cli]") {
    auto color = ParseArgs({"--color"});
    REQUIRE(color.IsOk());
    CHECK(color.Value().overrides.color == std::optional<bool>(true));

    auto both = ParseArgs({"--color", "--no-color"});
    REQUIRE(both.IsErr());
    CHECK(both.Error() == "--color and --no-color are mutually exclusive");
}

TEST_CASE("LoadFromCli: version flag", "[config][cli]") {
    auto result = ParseArgs({"--version"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version);
}

TEST_CASE("LoadFromCli: unknown argument", "[config][cli]") {
    auto result = ParseArgs({"--bogus"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("CLI parse error") == 0);
}

TEST_CASE("LoadFromCli: non-numeric login timeout", "[config][cli]") {
    auto result = ParseArgs({"--login-timeout", "soon"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("CLI parse error") == 0);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: empty overrides keep base", "[config][merge]") {
    auto base = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(base.IsOk());

    auto merged = MergeConfigs(base.Value(), ConfigOverrides{});
    CHECK(merged.log_level == LogLevel::Debug);
    CHECK(merged.log_file == base.Value().log_file);
    CHECK(merged.log_format == "json");
    CHECK(merged.color == std::optional<bool>(false));
    CHECK(merged.odbc.login_timeout == std::chrono::seconds(5));
    CHECK(merged.odbc.trust_server_certificate);
}

TEST_CASE("MergeConfigs: overrides replace base values", "[config][merge]") {
    AppConfig base;
    base.log_file = "/var/log/a.log";

    ConfigOverrides o;
    o.log_level = LogLevel::Error;
    o.log_file = "/var/log/b.log";
    o.log_format = "json";
    o.color = true;
    o.login_timeout_seconds = 60;
    o.trust_server_certificate = true;

    auto merged = MergeConfigs(base, o);
    CHECK(merged.log_level == LogLevel::Error);
    CHECK(merged.log_file == std::optional<std::string>("/var/log/b.log"));
    CHECK(merged.log_format == "json");
    CHECK(merged.color == std::optional<bool>(true));
    CHECK(merged.odbc.login_timeout == std::chrono::seconds(60));
    CHECK(merged.odbc.trust_server_certificate);
}

TEST_CASE("MergeConfigs: explicit false overrides true", "[config][merge]") {
    AppConfig base;
    base.odbc.trust_server_certificate = true;
    base.color = true;

    ConfigOverrides o;
    o.trust_server_certificate = false;
    o.color = false;

    auto merged = MergeConfigs(base, o);
    CHECK_FALSE(merged.odbc.trust_server_certificate);
    CHECK(merged.color == std::optional<bool>(false));
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: negative login timeout", "[config][validate]") {
    AppConfig config;
    config.odbc.login_timeout = std::chrono::seconds(-1);
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("login timeout") != std::string::npos);
}

TEST_CASE("ValidateConfig: zero login timeout is allowed", "[config][validate]") {
    AppConfig config;
    config.odbc.login_timeout = std::chrono::seconds(0);
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: unknown log format", "[config][validate]") {
    AppConfig config;
    config.log_format = "xml";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("'xml'") != std::string::npos);
}

TEST_CASE("ValidateConfig: empty log file path", "[config][validate]") {
    AppConfig config;
    config.log_file = "";
    CHECK(ValidateConfig(config).IsErr());
}
