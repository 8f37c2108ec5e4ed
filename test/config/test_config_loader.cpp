#include <catch2/catch_test_macros.hpp>

#include <dufs_mcp/config/config_loader.hpp>

#include <map>
#include <string>
#include <vector>

using namespace dufs_mcp;

namespace {

std::string TestDataPath(const std::string& filename) {
    return std::string(DUFS_MCP_TESTDATA_DIR) + "/" + filename;
}

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

EnvLookup EmptyEnv() {
    return FakeEnv({});
}

// argv helper: keeps the strings alive for the duration of a test.
struct Argv {
    explicit Argv(std::vector<std::string> args = {}) : storage(std::move(args)) {
        storage.insert(storage.begin(), "dufs-mcp-server");
        for (const auto& s : storage) {
            pointers.push_back(s.c_str());
        }
    }
    int argc() const { return static_cast<int>(pointers.size()); }
    const char* const* argv() const { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<const char*> pointers;
};

AppConfig ValidConfig() {
    AppConfig config;
    config.storage.url = "http://localhost:5000";
    return config;
}

} // anonymous namespace

// ===========================================================================
// Defaults / ParseTransportMode
// ===========================================================================

TEST_CASE("AppConfig: defaults", "[config]") {
    AppConfig config;
    CHECK(config.storage.url.empty());
    CHECK(config.storage.timeout_seconds == 30);
    CHECK_FALSE(config.storage.allow_insecure);
    CHECK(config.upload_dir == "uploads");
    CHECK(config.mode == TransportMode::Stdio);
    CHECK(config.listen_host == "0.0.0.0");
    CHECK(config.port == 7887);
    CHECK(config.job_workers == 2);
    CHECK(config.log_level == LogLevel::Info);
}

TEST_CASE("ParseTransportMode: known modes", "[config]") {
    CHECK(ParseTransportMode("stdio").Value() == TransportMode::Stdio);
    CHECK(ParseTransportMode("http").Value() == TransportMode::Http);
    CHECK(ParseTransportMode("sse").Value() == TransportMode::Http);
    CHECK(std::string(ToString(TransportMode::Http)) == "http");
}

TEST_CASE("ParseTransportMode: unknown mode", "[config]") {
    auto r = ParseTransportMode("STDIO");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    CHECK(r.Error().message == "Unknown mode: STDIO. Supported modes: stdio, http, sse");
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: full config", "[config][yaml]") {
    auto r = LoadFromYaml(TestDataPath("config_full.yaml"));
    REQUIRE(r.IsOk());
    const auto& layer = r.Value();

    CHECK(layer.url == "http://files.internal:5000/share");
    CHECK(layer.username == "admin");
    CHECK(layer.password == "yaml-secret");
    CHECK(layer.allow_insecure == true);
    CHECK(layer.timeout_seconds == 45);
    CHECK(layer.upload_dir == "incoming");
    CHECK(layer.mode == TransportMode::Http);
    CHECK(layer.listen_host == "127.0.0.1");
    CHECK(layer.port == 9000);
    CHECK(layer.job_workers == 4);
    CHECK(layer.log_level == LogLevel::Debug);
    CHECK(layer.json_logs == true);
}

TEST_CASE("LoadFromYaml: partial config leaves other fields unset", "[config][yaml]") {
    auto r = LoadFromYaml(TestDataPath("config_partial.yaml"));
    REQUIRE(r.IsOk());
    CHECK(r.Value().url == "http://localhost:5000");
    CHECK_FALSE(r.Value().username.has_value());
    CHECK_FALSE(r.Value().mode.has_value());
    CHECK_FALSE(r.Value().port.has_value());
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto r = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    CHECK(r.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto r = LoadFromYaml(TestDataPath("config_malformed.yaml"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.find("config_malformed.yaml") != std::string::npos);
}

TEST_CASE("LoadFromYaml: wrong value type", "[config][yaml]") {
    auto r = LoadFromYaml(TestDataPath("config_bad_type.yaml"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: unknown mode", "[config][yaml]") {
    auto r = LoadFromYaml(TestDataPath("config_bad_mode.yaml"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Unknown mode: websocket. Supported modes: stdio, http, sse");
}

// ===========================================================================
// LoadFromEnv
// ===========================================================================

TEST_CASE("LoadFromEnv: empty environment sets nothing", "[config][env]") {
    auto r = LoadFromEnv(EmptyEnv());
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().url.has_value());
    CHECK_FALSE(r.Value().mode.has_value());
    CHECK_FALSE(r.Value().port.has_value());
}

TEST_CASE("LoadFromEnv: reads all variables", "[config][env]") {
    auto r = LoadFromEnv(FakeEnv({
        {"DUFS_URL", "http://dufs:5000"},
        {"DUFS_USERNAME", "bob"},
        {"DUFS_PASSWORD", "pw"},
        {"DUFS_ALLOW_INSECURE", "true"},
        {"DUFS_TIMEOUT", "12"},
        {"DUFS_UPLOAD_DIR", "drop"},
        {"MCP_MODE", "http"},
        {"PORT", "8080"},
        {"DUFS_MCP_JOB_WORKERS", "3"},
        {"DUFS_MCP_LOG_LEVEL", "warn"},
    }));
    REQUIRE(r.IsOk());
    const auto& layer = r.Value();
    CHECK(layer.url == "http://dufs:5000");
    CHECK(layer.username == "bob");
    CHECK(layer.password == "pw");
    CHECK(layer.allow_insecure == true);
    CHECK(layer.timeout_seconds == 12);
    CHECK(layer.upload_dir == "drop");
    CHECK(layer.mode == TransportMode::Http);
    CHECK(layer.port == 8080);
    CHECK(layer.job_workers == 3);
    CHECK(layer.log_level == LogLevel::Warn);
}

TEST_CASE("LoadFromEnv: only the literal true enables insecure TLS", "[config][env]") {
    CHECK(LoadFromEnv(FakeEnv({{"DUFS_ALLOW_INSECURE", "1"}})).Value().allow_insecure == false);
    CHECK(LoadFromEnv(FakeEnv({{"DUFS_ALLOW_INSECURE", "TRUE"}})).Value().allow_insecure == false);
}

TEST_CASE("LoadFromEnv: empty MCP_MODE and PORT are ignored", "[config][env]") {
    auto r = LoadFromEnv(FakeEnv({{"MCP_MODE", ""}, {"PORT", ""}}));
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().mode.has_value());
    CHECK_FALSE(r.Value().port.has_value());
}

TEST_CASE("LoadFromEnv: invalid values", "[config][env]") {
    auto port = LoadFromEnv(FakeEnv({{"PORT", "80x"}}));
    REQUIRE(port.IsErr());
    CHECK(port.Error().message == "PORT must be an integer, got '80x'");

    auto timeout = LoadFromEnv(FakeEnv({{"DUFS_TIMEOUT", "soon"}}));
    REQUIRE(timeout.IsErr());
    CHECK(timeout.Error().message == "DUFS_TIMEOUT must be an integer, got 'soon'");

    auto mode = LoadFromEnv(FakeEnv({{"MCP_MODE", "grpc"}}));
    REQUIRE(mode.IsErr());
    CHECK(mode.Error().message == "Unknown mode: grpc. Supported modes: stdio, http, sse");

    auto level = LoadFromEnv(FakeEnv({{"DUFS_MCP_LOG_LEVEL", "loud"}}));
    REQUIRE(level.IsErr());
    CHECK(level.Error().message ==
          "DUFS_MCP_LOG_LEVEL must be one of debug, info, warn, error; got 'loud'");
}

// ===========================================================================
// ParseCli
// ===========================================================================

TEST_CASE("ParseCli: no arguments", "[config][cli]") {
    Argv args;
    auto r = ParseCli(args.argc(), args.argv());
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().config_file.has_value());
    CHECK_FALSE(r.Value().overrides.url.has_value());
    CHECK_FALSE(r.Value().overrides.allow_insecure.has_value());
    CHECK_FALSE(r.Value().overrides.log_level.has_value());
}

TEST_CASE("ParseCli: all flags", "[config][cli]") {
    Argv args({"--url", "http://h:1", "--username", "u", "--password", "p",
               "--insecure", "--timeout", "9", "--upload-dir", "up",
               "--mode", "sse", "--listen", "::1", "--port", "7000",
               "--job-workers", "5", "--log-level", "error", "--log-json",
               "--no-color", "-c", "/etc/dufs-mcp.yaml"});
    auto r = ParseCli(args.argc(), args.argv());
    REQUIRE(r.IsOk());
    const auto& cli = r.Value();
    CHECK(cli.config_file == "/etc/dufs-mcp.yaml");
    CHECK(cli.overrides.url == "http://h:1");
    CHECK(cli.overrides.username == "u");
    CHECK(cli.overrides.password == "p");
    CHECK(cli.overrides.allow_insecure == true);
    CHECK(cli.overrides.timeout_seconds == 9);
    CHECK(cli.overrides.upload_dir == "up");
    CHECK(cli.overrides.mode == TransportMode::Http);
    CHECK(cli.overrides.listen_host == "::1");
    CHECK(cli.overrides.port == 7000);
    CHECK(cli.overrides.job_workers == 5);
    CHECK(cli.overrides.log_level == LogLevel::Error);
    CHECK(cli.overrides.json_logs == true);
    CHECK(cli.overrides.no_color == true);
    CHECK_FALSE(cli.overrides.force_color.has_value());
}

TEST_CASE("ParseCli: --verbose selects debug", "[config][cli]") {
    Argv args({"-v"});
    auto r = ParseCli(args.argc(), args.argv());
    REQUIRE(r.IsOk());
    CHECK(r.Value().overrides.log_level == LogLevel::Debug);
}

TEST_CASE("ParseCli: unknown flag is an error", "[config][cli]") {
    Argv args({"--frobnicate"});
    auto r = ParseCli(args.argc(), args.argv());
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.rfind("CLI parse error: ", 0) == 0);
}

TEST_CASE("ParseCli: bad mode is an error", "[config][cli]") {
    Argv args({"--mode", "pipe"});
    auto r = ParseCli(args.argc(), args.argv());
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Unknown mode: pipe. Supported modes: stdio, http, sse");
}

// ===========================================================================
// LoadConfig: layering
// ===========================================================================

TEST_CASE("LoadConfig: defaults when nothing is set", "[config][layering]") {
    Argv args;
    auto r = LoadConfig(args.argc(), args.argv(), EmptyEnv());
    REQUIRE(r.IsOk());
    CHECK(r.Value().storage.url.empty());
    CHECK(r.Value().port == 7887);
}

TEST_CASE("LoadConfig: environment overrides YAML, CLI overrides both", "[config][layering]") {
    Argv args({"-c", TestDataPath("config_full.yaml"), "--port", "9100"});
    auto env = FakeEnv({{"DUFS_USERNAME", "env-user"}, {"PORT", "9050"}, {"MCP_MODE", "stdio"}});

    auto r = LoadConfig(args.argc(), args.argv(), env);
    REQUIRE(r.IsOk());
    const auto& config = r.Value();

    CHECK(config.storage.url == "http://files.internal:5000/share");  // YAML
    CHECK(config.storage.password == "yaml-secret");                 // YAML
    CHECK(config.storage.username == "env-user");                    // env over YAML
    CHECK(config.mode == TransportMode::Stdio);                      // env over YAML
    CHECK(config.port == 9100);                                      // CLI over env
    CHECK(config.job_workers == 4);
    CHECK(config.json_logs);
}

TEST_CASE("LoadConfig: YAML errors propagate", "[config][layering]") {
    Argv args({"--config", TestDataPath("config_bad_mode.yaml")});
    auto r = LoadConfig(args.argc(), args.argv(), EmptyEnv());
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "ConfigLoader");
}

TEST_CASE("LoadConfig: environment errors propagate", "[config][layering]") {
    Argv args;
    auto r = LoadConfig(args.argc(), args.argv(), FakeEnv({{"DUFS_MCP_JOB_WORKERS", "many"}}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "DUFS_MCP_JOB_WORKERS must be an integer, got 'many'");
}

TEST_CASE("ApplyOverrides: disengaged fields keep current values", "[config][layering]") {
    AppConfig config = ValidConfig();
    config.port = 1234;
    ConfigOverrides layer;
    layer.username = "x";
    ApplyOverrides(config, layer);
    CHECK(config.port == 1234);
    CHECK(config.storage.url == "http://localhost:5000");
    CHECK(config.storage.username == "x");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: minimal config is valid", "[config][validate]") {
    CHECK(ValidateConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: url is required", "[config][validate]") {
    auto r = ValidateConfig(AppConfig{});
    REQUIRE(r.IsErr());
    CHECK(r.Error().message ==
          "Missing required field: url (set DUFS_URL, --url or dufs.url)");
}

TEST_CASE("ValidateConfig: url must parse", "[config][validate]") {
    auto config = ValidConfig();
    config.storage.url = "ftp://host";
    auto r = ValidateConfig(config);
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.rfind("Invalid dufs URL: ", 0) == 0);
}

TEST_CASE("ValidateConfig: numeric ranges", "[config][validate]") {
    auto timeout = ValidConfig();
    timeout.storage.timeout_seconds = 0;
    CHECK(ValidateConfig(timeout).Error().message == "Timeout must be positive, got 0");

    auto port = ValidConfig();
    port.port = 70000;
    CHECK(ValidateConfig(port).Error().message == "Invalid port: 70000");

    auto workers = ValidConfig();
    workers.job_workers = 0;
    CHECK(ValidateConfig(workers).Error().message == "job_workers must be at least 1, got 0");
}
