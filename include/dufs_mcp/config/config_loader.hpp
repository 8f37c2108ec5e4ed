#pragma once

#include <dufs_mcp/config/app_config.hpp>
#include <dufs_mcp/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace dufs_mcp {

// Environment variable lookup; injectable so tests need not touch the
// process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Lookup backed by std::getenv.
EnvLookup ProcessEnv();

// ---------------------------------------------------------------------------
// CliArguments: parsed command line: the config file to read, if any,
// and the overrides given as flags.
// ---------------------------------------------------------------------------
struct CliArguments {
    std::optional<std::string> config_file;
    ConfigOverrides overrides;
};

/// "stdio", "http" or "sse" (case-sensitive).
Result<TransportMode, Error> ParseTransportMode(std::string_view text);

/// Parse a YAML config file into an override layer.
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path);

/// Read DUFS_URL, DUFS_USERNAME, DUFS_PASSWORD, DUFS_ALLOW_INSECURE,
/// DUFS_TIMEOUT, DUFS_UPLOAD_DIR, MCP_MODE, PORT, DUFS_MCP_JOB_WORKERS
/// and DUFS_MCP_LOG_LEVEL.
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env);

/// Parse CLI arguments. --help and --version print and exit the process.
Result<CliArguments, Error> ParseCli(int argc, const char* const* argv);

/// Apply every engaged field of `layer` on top of `config`.
void ApplyOverrides(AppConfig& config, const ConfigOverrides& layer);

/// Defaults < YAML file < environment < command line.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv,
                                    const EnvLookup& env);

/// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace dufs_mcp
