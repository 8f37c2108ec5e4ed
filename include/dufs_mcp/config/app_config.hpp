#pragma once

#include <dufs_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace dufs_mcp {

enum class TransportMode {
    Stdio,
    Http,  // also selected by "sse"
};

const char* ToString(TransportMode mode);

struct StorageConfig {
    std::string url;  // dufs base URL, may carry a path prefix
    std::string username;
    std::string password;
    bool allow_insecure = false;
    int timeout_seconds = 30;
};

struct AppConfig {
    StorageConfig storage;
    std::string upload_dir = "uploads";
    TransportMode mode = TransportMode::Stdio;
    std::string listen_host = "0.0.0.0";
    int port = 7887;
    int job_workers = 2;
    LogLevel log_level = LogLevel::Info;
    bool json_logs = false;
    bool force_color = false;
    bool no_color = false;
};

// ---------------------------------------------------------------------------
// ConfigOverrides: one configuration layer (YAML file, environment or
// command line). Only the fields a layer actually sets are engaged.
// ---------------------------------------------------------------------------
struct ConfigOverrides {
    std::optional<std::string> url;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<bool> allow_insecure;
    std::optional<int> timeout_seconds;
    std::optional<std::string> upload_dir;
    std::optional<TransportMode> mode;
    std::optional<std::string> listen_host;
    std::optional<int> port;
    std::optional<int> job_workers;
    std::optional<LogLevel> log_level;
    std::optional<bool> json_logs;
    std::optional<bool> force_color;
    std::optional<bool> no_color;
};

} // namespace dufs_mcp
