#include <dufs_mcp/config/config_loader.hpp>
#include <dufs_mcp/core/log.hpp>
#include <dufs_mcp/core/terminal.hpp>
#include <dufs_mcp/core/url.hpp>
#include <dufs_mcp/core/version.hpp>
#include <dufs_mcp/jobs/job_runner.hpp>
#include <dufs_mcp/jobs/job_store.hpp>
#include <dufs_mcp/mcp/dufs_tools.hpp>
#include <dufs_mcp/mcp/mcp_server.hpp>
#include <dufs_mcp/mcp/tool_registry.hpp>
#include <dufs_mcp/storage/storage_client.hpp>
#include <dufs_mcp/transport/http_transport.hpp>
#include <dufs_mcp/transport/stdio_transport.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess   = 0;
constexpr int kExitConfig    = 1;
constexpr int kExitTransport = 2;

void InitLogging(const dufs_mcp::AppConfig& config) {
    using namespace dufs_mcp;
    if (config.json_logs) {
        InitGlobalLogger(std::make_unique<JsonSink>(), config.log_level);
        return;
    }
    const bool use_color = ResolveLogColor(config.force_color, config.no_color);
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), config.log_level);
}

int Serve(const dufs_mcp::AppConfig& config, const dufs_mcp::McpServer& server) {
    using namespace dufs_mcp;
    if (config.mode == TransportMode::Stdio) {
        StdioTransport transport(server);
        auto run = transport.Run();
        if (run.IsErr()) {
            LogError("stdio", run.Error().ToString());
            return kExitTransport;
        }
        return kExitSuccess;
    }

    HttpTransport transport(server, HttpTransportOptions{config.listen_host, config.port});
    auto run = transport.Listen();
    if (run.IsErr()) {
        LogError("http", run.Error().ToString());
        return kExitTransport;
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace dufs_mcp;

    // Parse CLI (handles --help/--version), YAML and environment.
    auto config_result = LoadConfig(argc, argv, ProcessEnv());
    if (config_result.IsErr()) {
        std::cerr << "Error: " << config_result.Error().message << "\n";
        return kExitConfig;
    }
    const auto config = std::move(config_result).Value();

    InitLogging(config);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        LogError("config", valid.Error().message);
        return kExitConfig;
    }
    auto base_url = ParseBaseUrl(config.storage.url);
    if (base_url.IsErr()) {
        LogError("config", base_url.Error().ToString());
        return kExitConfig;
    }

    StorageClientOptions storage_options;
    storage_options.username = config.storage.username;
    storage_options.password = config.storage.password;
    storage_options.timeout = std::chrono::seconds(config.storage.timeout_seconds);
    storage_options.allow_insecure = config.storage.allow_insecure;
    DufsStorageClient client(std::move(base_url).Value(), storage_options);

    JobStore jobs;
    JobRunner runner(jobs, client, JobRunnerOptions{config.upload_dir, config.job_workers});

    ToolRegistry registry;
    RegisterDufsTools(registry, DufsToolContext{client, jobs, runner, config.upload_dir});
    const McpServer server(std::move(registry));

    LogInfo("mcp", std::string("dufs-mcp-server ") + kVersion + " starting (" +
                       ToString(config.mode) + " mode)");
    LogInfo("mcp", "dufs URL: " + config.storage.url);

    const int exit_code = Serve(config, server);

    // Running uploads finish; queued ones are dropped.
    runner.Stop();
    return exit_code;
}
