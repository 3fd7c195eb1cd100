#pragma once

#include <mssql_mcp/config/app_config.hpp>
#include <mssql_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace mssql_mcp {

// Parse a YAML config file into an AppConfig. Missing keys keep defaults.
Result<AppConfig, std::string> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments. --help prints usage and exits the process.
Result<CliOptions, std::string> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of a base config (YAML or defaults).
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides);

// Validate that values are sane.
Result<void, std::string> ValidateConfig(const AppConfig& config);

} // namespace mssql_mcp
