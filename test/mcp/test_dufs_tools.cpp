#include <catch2/catch_test_macros.hpp>

#include <dufs_mcp/jobs/job_runner.hpp>
#include <dufs_mcp/jobs/job_store.hpp>
#include <dufs_mcp/mcp/dufs_tools.hpp>
#include <dufs_mcp/mcp/mcp_server.hpp>

#include "mocks/mock_storage_client.hpp"
#include "support/temp_dir.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace dufs_mcp;
using namespace dufs_mcp::testing;
using json = nlohmann::json;

namespace {

constexpr std::chrono::milliseconds kWait{5000};

Clock FixedClock() {
    const Timestamp t{std::chrono::seconds(1709640000)};
    return [t] { return t; };
}

// Wires the tools to a mock client, an in-memory job store and a
// single-worker runner.
struct ToolFixture {
    MockStorageClient mock;
    JobStore jobs{FixedClock()};
    JobRunner runner{jobs, mock, JobRunnerOptions{"uploads", 1}, FixedClock()};
    ToolRegistry registry;

    ToolFixture() {
        RegisterDufsTools(registry, DufsToolContext{mock, jobs, runner, "uploads",
                                                    FixedClock()});
    }

    Result<json, Error> Run(const std::string& tool, const json& args) {
        return registry.Execute(tool, args);
    }
};

std::string Dated(const std::string& name) {
    return "uploads/" + FormatDateStamp(FixedClock()()) + "/" + name;
}

} // anonymous namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("RegisterDufsTools: registers the eleven tools in order", "[mcp][tools]") {
    ToolFixture f;
    const std::vector<std::string> expected = {
        "dufs_upload", "dufs_upload_batch", "dufs_upload_status", "dufs_download",
        "dufs_delete", "dufs_list", "dufs_create_dir", "dufs_move",
        "dufs_get_hash", "dufs_download_folder", "dufs_health"};

    const auto& tools = f.registry.Tools();
    REQUIRE(tools.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        CHECK(tools[i].name == expected[i]);
        CHECK_FALSE(tools[i].description.empty());
        CHECK(tools[i].input_schema["type"] == "object");
    }
}

TEST_CASE("RegisterDufsTools: schemas declare required fields", "[mcp][tools]") {
    ToolFixture f;
    const auto& tools = f.registry.Tools();
    CHECK(tools[0].input_schema["required"] == json::array({"local_path"}));
    CHECK(tools[0].input_schema["properties"]["async"]["default"] == false);
    CHECK(tools[1].input_schema["properties"]["async"]["default"] == true);
    CHECK(tools[5].input_schema["properties"]["format"]["enum"] ==
          json::array({"json", "simple"}));
    CHECK_FALSE(tools[5].input_schema.contains("required"));
    CHECK(tools[7].input_schema["required"] == json::array({"source", "destination"}));
}

// ===========================================================================
// dufs_upload
// ===========================================================================

TEST_CASE("dufs_upload: synchronous upload to dated path", "[mcp][tools]") {
    TempDir tmp;
    const auto local = tmp.WriteFile("a.txt", "A");
    ToolFixture f;
    f.mock.EnqueuePut(OkResponse(201));

    auto r = f.Run("dufs_upload", {{"local_path", local}});
    REQUIRE(r.IsOk());
    const auto& p = r.Value();
    CHECK(p["success"] == true);
    CHECK(p["remote_path"] == Dated("a.txt"));
    CHECK(p["message"] == "File uploaded successfully to " + Dated("a.txt"));
    CHECK(p["status"] == 201);
    CHECK(f.mock.MakeCollectionCallCount() == 2);
}

TEST_CASE("dufs_upload: async returns a job id", "[mcp][tools]") {
    TempDir tmp;
    const auto local = tmp.WriteFile("a.txt", "A");
    ToolFixture f;
    f.mock.EnqueuePut(OkResponse(201));

    auto r = f.Run("dufs_upload", {{"local_path", local}, {"remote_path", "docs/a.txt"},
                                   {"async", true}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["success"] == true);
    CHECK(r.Value()["status"] == "pending");
    CHECK(r.Value()["task_count"] == 1);
    const auto id = r.Value()["job_id"].get<std::string>();

    REQUIRE(f.runner.WaitIdle(kWait));
    auto status = f.Run("dufs_upload_status", {{"job_id", id}});
    REQUIRE(status.IsOk());
    CHECK(status.Value()["success"] == true);
    CHECK(status.Value()["job"]["status"] == "completed");
    CHECK(status.Value()["job"]["tasks"][0]["resolved_remote_path"] == "docs/a.txt");
}

TEST_CASE("dufs_upload: missing local_path names the tool", "[mcp][tools]") {
    ToolFixture f;
    auto r = f.Run("dufs_upload", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "dufs_upload");
    CHECK(r.Error().message == "Missing required parameter: local_path");
    CHECK(f.jobs.Size() == 0);
}

TEST_CASE("dufs_upload: storage failure is reported", "[mcp][tools]") {
    TempDir tmp;
    const auto local = tmp.WriteFile("a.txt", "A");
    ToolFixture f;
    f.mock.EnqueuePut(OkResponse(401));

    auto r = f.Run("dufs_upload", {{"local_path", local}, {"remote_path", "a.txt"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Authentication);
    CHECK(r.Error().http_status == 401);
}

// ===========================================================================
// dufs_upload_batch / dufs_upload_status
// ===========================================================================

TEST_CASE("dufs_upload_batch: async by default", "[mcp][tools]") {
    TempDir tmp;
    const auto a = tmp.WriteFile("a.txt", "A");
    const auto b = tmp.WriteFile("b.txt", "B");
    ToolFixture f;
    f.mock.EnqueuePut(OkResponse(201));
    f.mock.EnqueuePut(OkResponse(201));

    auto r = f.Run("dufs_upload_batch",
                   {{"files", json::array({{{"local_path", a}}, {{"local_path", b}}})}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["task_count"] == 2);
    CHECK(r.Value()["status"] == "pending");
    REQUIRE(f.runner.WaitIdle(kWait));

    auto job = f.jobs.Get(r.Value()["job_id"].get<std::string>());
    REQUIRE(job.IsOk());
    CHECK(job.Value().status == JobStatus::Completed);
}

TEST_CASE("dufs_upload_batch: synchronous reports every file", "[mcp][tools]") {
    TempDir tmp;
    const auto a = tmp.WriteFile("a.txt", "A");
    ToolFixture f;
    f.mock.EnqueuePut(OkResponse(201));

    json files = json::array({
        {{"local_path", a}, {"remote_path", "x/a.txt"}},
        {{"local_path", tmp.Path("missing.txt")}, {"remote_path", "x/m.txt"}}
    });
    auto r = f.Run("dufs_upload_batch", {{"files", files}, {"async", false}});
    REQUIRE(r.IsOk());
    const auto& p = r.Value();
    CHECK(p["success"] == false);
    CHECK(p["count"] == 2);
    CHECK(p["results"][0]["success"] == true);
    CHECK(p["results"][0]["remote_path"] == "x/a.txt");
    CHECK(p["results"][0]["status"] == 201);
    CHECK(p["results"][1]["success"] == false);
    CHECK(p["results"][1]["status"] == 0);
    CHECK(p["results"][1]["remote_path"] == "x/m.txt");
    CHECK(p["results"][1]["error"].get<std::string>().find("Failed to open file") !=
          std::string::npos);
}

TEST_CASE("dufs_upload_status: unknown job is NotFound", "[mcp][tools]") {
    ToolFixture f;
    auto r = f.Run("dufs_upload_status", {{"job_id", "job-0-0"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
    CHECK(r.Error().message == "Job not found: job-0-0");
}

// ===========================================================================
// Downloads
// ===========================================================================

TEST_CASE("dufs_download: reports local path and size", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueGetToFile(Result<DownloadResponse, Error>::Ok({200, 5, ""}));

    auto r = f.Run("dufs_download", {{"remote_path", "docs/a.txt"}, {"local_path", "/tmp/a"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["message"] == "File downloaded successfully to /tmp/a");
    CHECK(r.Value()["local_path"] == "/tmp/a");
    CHECK(r.Value()["size_bytes"] == 5);
    CHECK(r.Value()["status"] == 200);
}

TEST_CASE("dufs_download_folder: zip with derived name", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueGetToFile(Result<DownloadResponse, Error>::Ok({200, 99, ""}));

    auto r = f.Run("dufs_download_folder", {{"remote_path", "docs"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["local_path"] == "docs.zip");
    CHECK(r.Value()["message"] == "Folder downloaded successfully to docs.zip");
    CHECK(f.mock.GetToFileCalls()[0].path == "docs?zip");
}

// ===========================================================================
// Entry tools
// ===========================================================================

TEST_CASE("dufs_delete: success message", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueDelete(OkResponse(200));
    auto r = f.Run("dufs_delete", {{"path", "docs/a.txt"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["message"] == "Deleted docs/a.txt successfully");
    CHECK(r.Value()["status"] == 200);
}

TEST_CASE("dufs_list: json listing is embedded", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueGet(OkResponse(200, R"({"paths":[]})"));
    auto r = f.Run("dufs_list", {{"path", "docs"}, {"format", "json"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["success"] == true);
    CHECK(r.Value()["data"]["paths"].is_array());
    CHECK(f.mock.GetCalls()[0].path == "docs?json");
}

TEST_CASE("dufs_list: search query", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueGet(OkResponse(200, "a.txt\n"));
    auto r = f.Run("dufs_list", {{"query", "a"}, {"format", "simple"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["data"] == "a.txt\n");
    CHECK(f.mock.GetCalls()[0].path == "/?q=a&simple");
}

TEST_CASE("dufs_create_dir: created and existing", "[mcp][tools]") {
    ToolFixture f;
    auto created = f.Run("dufs_create_dir", {{"path", "docs"}});
    REQUIRE(created.IsOk());
    CHECK(created.Value()["message"] == "Directory docs created successfully");
    CHECK(created.Value()["status"] == 201);

    f.mock.EnqueueMakeCollection(
        Result<CollectionResult, Error>::Ok(
            CollectionResult{CollectionStatus::AlreadyExists, 405}));
    auto existing = f.Run("dufs_create_dir", {{"path", "docs"}});
    REQUIRE(existing.IsOk());
    CHECK(existing.Value()["success"] == true);
    CHECK(existing.Value()["message"] == "Directory docs already exists");
    CHECK(existing.Value()["status"] == 405);
}

TEST_CASE("dufs_move: success message", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueMove(OkResponse(201));
    auto r = f.Run("dufs_move", {{"source", "a.txt"}, {"destination", "b.txt"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["message"] == "Moved a.txt to b.txt successfully");
}

TEST_CASE("dufs_get_hash: returns hash and path", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueGet(OkResponse(200, "deadbeef"));
    auto r = f.Run("dufs_get_hash", {{"path", "a.txt"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["hash"] == "deadbeef");
    CHECK(r.Value()["path"] == "a.txt");
}

TEST_CASE("dufs_health: unhealthy server is not an error", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueGet(OkResponse(503));
    auto r = f.Run("dufs_health", json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value()["success"] == false);
    CHECK(r.Value()["healthy"] == false);
    CHECK(r.Value()["status"] == 503);
}

// ===========================================================================
// Through the server
// ===========================================================================

TEST_CASE("dufs tools: reachable through tools/call", "[mcp][tools]") {
    ToolFixture f;
    f.mock.EnqueueGet(OkResponse(200));
    McpServer server(f.registry);

    auto response = server.HandleLine(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"dufs_health"}})");
    REQUIRE(response.has_value());
    auto text = (*response)["result"]["content"][0]["text"].get<std::string>();
    CHECK(json::parse(text)["healthy"] == true);
}
