#include <dufs_mcp/config/config_loader.hpp>

#include <dufs_mcp/core/url.hpp>
#include <dufs_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace dufs_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message,
                 ErrorCategory::InvalidArgument};
}

Result<int, Error> ParseInt(const std::string& name, const std::string& text) {
    try {
        size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return Result<int, Error>::Ok(value);
    } catch (const std::logic_error&) {
        return Result<int, Error>::Err(
            MakeConfigError(name + " must be an integer, got '" + text + "'"));
    }
}

Result<LogLevel, Error> ParseLevel(const std::string& name, const std::string& text) {
    auto level = ParseLogLevel(text);
    if (!level) {
        return Result<LogLevel, Error>::Err(MakeConfigError(
            name + " must be one of debug, info, warn, error; got '" + text + "'"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

} // anonymous namespace

const char* ToString(TransportMode mode) {
    switch (mode) {
        case TransportMode::Stdio: return "stdio";
        case TransportMode::Http:  return "http";
    }
    return "stdio";
}

EnvLookup ProcessEnv() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

Result<TransportMode, Error> ParseTransportMode(std::string_view text) {
    if (text == "stdio") {
        return Result<TransportMode, Error>::Ok(TransportMode::Stdio);
    }
    if (text == "http" || text == "sse") {
        return Result<TransportMode, Error>::Ok(TransportMode::Http);
    }
    return Result<TransportMode, Error>::Err(MakeConfigError(
        "Unknown mode: " + std::string(text) + ". Supported modes: stdio, http, sse"));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path) {
    ConfigOverrides layer;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- dufs connection --
        if (const auto dufs = root["dufs"]) {
            if (dufs["url"]) layer.url = dufs["url"].as<std::string>();
            if (dufs["username"]) layer.username = dufs["username"].as<std::string>();
            if (dufs["password"]) layer.password = dufs["password"].as<std::string>();
            if (dufs["allow_insecure"]) {
                layer.allow_insecure = dufs["allow_insecure"].as<bool>();
            }
            if (dufs["timeout"]) layer.timeout_seconds = dufs["timeout"].as<int>();
        }

        // -- Server --
        if (root["upload_dir"]) layer.upload_dir = root["upload_dir"].as<std::string>();
        if (root["mode"]) {
            auto mode = ParseTransportMode(root["mode"].as<std::string>());
            if (mode.IsErr()) {
                return Result<ConfigOverrides, Error>::Err(std::move(mode).Error());
            }
            layer.mode = mode.Value();
        }
        if (root["listen"]) layer.listen_host = root["listen"].as<std::string>();
        if (root["port"]) layer.port = root["port"].as<int>();
        if (root["job_workers"]) layer.job_workers = root["job_workers"].as<int>();

        // -- Logging --
        if (root["log_level"]) {
            auto level = ParseLevel("log_level", root["log_level"].as<std::string>());
            if (level.IsErr()) {
                return Result<ConfigOverrides, Error>::Err(std::move(level).Error());
            }
            layer.log_level = level.Value();
        }
        if (root["json_logs"]) layer.json_logs = root["json_logs"].as<bool>();
    } catch (const YAML::Exception& e) {
        return Result<ConfigOverrides, Error>::Err(MakeConfigError(
            "Failed to parse YAML file " + std::string(file_path) + ": " + e.what()));
    }
    return Result<ConfigOverrides, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env) {
    ConfigOverrides layer;

    if (auto val = env("DUFS_URL")) layer.url = *val;
    if (auto val = env("DUFS_USERNAME")) layer.username = *val;
    if (auto val = env("DUFS_PASSWORD")) layer.password = *val;
    if (auto val = env("DUFS_ALLOW_INSECURE")) layer.allow_insecure = (*val == "true");
    if (auto val = env("DUFS_UPLOAD_DIR")) layer.upload_dir = *val;

    if (auto val = env("DUFS_TIMEOUT")) {
        auto parsed = ParseInt("DUFS_TIMEOUT", *val);
        if (parsed.IsErr()) return Result<ConfigOverrides, Error>::Err(parsed.Error());
        layer.timeout_seconds = parsed.Value();
    }
    if (auto val = env("MCP_MODE"); val && !val->empty()) {
        auto mode = ParseTransportMode(*val);
        if (mode.IsErr()) return Result<ConfigOverrides, Error>::Err(mode.Error());
        layer.mode = mode.Value();
    }
    if (auto val = env("PORT"); val && !val->empty()) {
        auto parsed = ParseInt("PORT", *val);
        if (parsed.IsErr()) return Result<ConfigOverrides, Error>::Err(parsed.Error());
        layer.port = parsed.Value();
    }
    if (auto val = env("DUFS_MCP_JOB_WORKERS")) {
        auto parsed = ParseInt("DUFS_MCP_JOB_WORKERS", *val);
        if (parsed.IsErr()) return Result<ConfigOverrides, Error>::Err(parsed.Error());
        layer.job_workers = parsed.Value();
    }
    if (auto val = env("DUFS_MCP_LOG_LEVEL")) {
        auto level = ParseLevel("DUFS_MCP_LOG_LEVEL", *val);
        if (level.IsErr()) return Result<ConfigOverrides, Error>::Err(level.Error());
        layer.log_level = level.Value();
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// ParseCli
// ---------------------------------------------------------------------------
Result<CliArguments, Error> ParseCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("dufs-mcp-server", kVersion);
    program.add_description("MCP server exposing a dufs file server as tools.");

    // dufs connection
    program.add_argument("--url")
        .help("dufs base URL, e.g. http://127.0.0.1:5000");
    program.add_argument("--username")
        .help("dufs username");
    program.add_argument("--password")
        .help("dufs password");
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--timeout")
        .help("Request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--upload-dir")
        .help("Remote base directory for uploads without a remote_path");

    // Transport
    program.add_argument("--mode")
        .help("Transport: stdio, http or sse");
    program.add_argument("--listen")
        .help("HTTP listen address");
    program.add_argument("--port")
        .help("HTTP listen port")
        .scan<'i', int>();
    program.add_argument("--job-workers")
        .help("Background upload workers")
        .scan<'i', int>();

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("-v", "--verbose")
        .help("Shorthand for --log-level debug")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-json")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored logs")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliArguments, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliArguments cli;
    auto& layer = cli.overrides;

    if (auto val = program.present("--config")) cli.config_file = *val;

    if (auto val = program.present("--url")) layer.url = *val;
    if (auto val = program.present("--username")) layer.username = *val;
    if (auto val = program.present("--password")) layer.password = *val;
    if (program.get<bool>("--insecure")) layer.allow_insecure = true;
    if (auto val = program.present<int>("--timeout")) layer.timeout_seconds = *val;
    if (auto val = program.present("--upload-dir")) layer.upload_dir = *val;

    if (auto val = program.present("--mode")) {
        auto mode = ParseTransportMode(*val);
        if (mode.IsErr()) return Result<CliArguments, Error>::Err(mode.Error());
        layer.mode = mode.Value();
    }
    if (auto val = program.present("--listen")) layer.listen_host = *val;
    if (auto val = program.present<int>("--port")) layer.port = *val;
    if (auto val = program.present<int>("--job-workers")) layer.job_workers = *val;

    if (auto val = program.present("--log-level")) {
        auto level = ParseLevel("--log-level", *val);
        if (level.IsErr()) return Result<CliArguments, Error>::Err(level.Error());
        layer.log_level = level.Value();
    }
    if (program.get<bool>("--verbose")) layer.log_level = LogLevel::Debug;
    if (program.get<bool>("--log-json")) layer.json_logs = true;
    if (program.get<bool>("--color")) layer.force_color = true;
    if (program.get<bool>("--no-color")) layer.no_color = true;

    return Result<CliArguments, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyOverrides
// ---------------------------------------------------------------------------
void ApplyOverrides(AppConfig& config, const ConfigOverrides& layer) {
    if (layer.url) config.storage.url = *layer.url;
    if (layer.username) config.storage.username = *layer.username;
    if (layer.password) config.storage.password = *layer.password;
    if (layer.allow_insecure) config.storage.allow_insecure = *layer.allow_insecure;
    if (layer.timeout_seconds) config.storage.timeout_seconds = *layer.timeout_seconds;
    if (layer.upload_dir) config.upload_dir = *layer.upload_dir;
    if (layer.mode) config.mode = *layer.mode;
    if (layer.listen_host) config.listen_host = *layer.listen_host;
    if (layer.port) config.port = *layer.port;
    if (layer.job_workers) config.job_workers = *layer.job_workers;
    if (layer.log_level) config.log_level = *layer.log_level;
    if (layer.json_logs) config.json_logs = *layer.json_logs;
    if (layer.force_color) config.force_color = *layer.force_color;
    if (layer.no_color) config.no_color = *layer.no_color;
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv,
                                    const EnvLookup& env) {
    auto cli = ParseCli(argc, argv);
    if (cli.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(cli).Error());
    }

    AppConfig config;
    if (cli.Value().config_file) {
        auto yaml = LoadFromYaml(*cli.Value().config_file);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(yaml).Error());
        }
        ApplyOverrides(config, yaml.Value());
    }

    auto from_env = LoadFromEnv(env);
    if (from_env.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(from_env).Error());
    }
    ApplyOverrides(config, from_env.Value());
    ApplyOverrides(config, cli.Value().overrides);

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.storage.url.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing required field: url (set DUFS_URL, --url or dufs.url)"));
    }
    auto url = ParseBaseUrl(config.storage.url);
    if (url.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid dufs URL: " + url.Error().message));
    }
    if (config.storage.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.storage.timeout_seconds)));
    }
    if (config.port <= 0 || config.port > 65535) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid port: " + std::to_string(config.port)));
    }
    if (config.job_workers < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("job_workers must be at least 1, got " +
                            std::to_string(config.job_workers)));
    }
    return Result<void, Error>::Ok();
}

} // namespace dufs_mcp
