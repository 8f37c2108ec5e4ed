#include <catch2/catch_test_macros.hpp>

#include <dufs_mcp/storage/transfer.hpp>

#include "mocks/mock_storage_client.hpp"
#include "support/temp_dir.hpp"

using namespace dufs_mcp;
using namespace dufs_mcp::testing;

// ===========================================================================
// EnsureRemoteDirectories
// ===========================================================================

TEST_CASE("EnsureRemoteDirectories: creates each parent in order", "[storage][transfer]") {
    MockStorageClient mock;
    auto r = EnsureRemoteDirectories(mock, "a/b/c.txt");
    REQUIRE(r.IsOk());
    auto calls = mock.MakeCollectionCalls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "a");
    CHECK(calls[1] == "a/b");
}

TEST_CASE("EnsureRemoteDirectories: existing directory is success", "[storage][transfer]") {
    MockStorageClient mock;
    mock.EnqueueMakeCollection(
        Result<CollectionResult, Error>::Ok(
            CollectionResult{CollectionStatus::AlreadyExists, 405}));
    CHECK(EnsureRemoteDirectories(mock, "a/b/c.txt").IsOk());
    CHECK(mock.MakeCollectionCallCount() == 2);
}

TEST_CASE("EnsureRemoteDirectories: stops at first failure", "[storage][transfer]") {
    MockStorageClient mock;
    mock.EnqueueMakeCollection(Result<CollectionResult, Error>::Err(
        Error::FromHttpStatus("MakeCollection", "a", 403)));
    auto r = EnsureRemoteDirectories(mock, "a/b/c.txt");
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.find("Failed to create remote directory a") == 0);
    CHECK(r.Error().http_status == 403);
    CHECK(mock.MakeCollectionCallCount() == 1);
}

// ===========================================================================
// UploadFile
// ===========================================================================

TEST_CASE("UploadFile: creates parents then PUTs", "[storage][transfer]") {
    TempDir tmp;
    const auto local = tmp.WriteFile("a.txt", "hello");
    MockStorageClient mock;
    mock.EnqueuePut(OkResponse(201));

    auto r = UploadFile(mock, local, "docs/2024/a.txt");
    REQUIRE(r.IsOk());
    CHECK(r.Value().remote_path == "docs/2024/a.txt");
    CHECK(r.Value().status_code == 201);

    CHECK(mock.MakeCollectionCalls() == std::vector<std::string>{"docs", "docs/2024"});
    auto puts = mock.PutCalls();
    REQUIRE(puts.size() == 1);
    CHECK(puts[0].path == "docs/2024/a.txt");
    CHECK(puts[0].local_file == local);
}

TEST_CASE("UploadFile: missing local file fails before any request", "[storage][transfer]") {
    TempDir tmp;
    MockStorageClient mock;

    auto r = UploadFile(mock, tmp.Path("missing.txt"), "docs/a.txt");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
    CHECK(r.Error().message.find("Failed to open file") == 0);
    CHECK(mock.MakeCollectionCallCount() == 0);
    CHECK(mock.PutCallCount() == 0);
}

TEST_CASE("UploadFile: directory is not a regular file", "[storage][transfer]") {
    TempDir tmp;
    MockStorageClient mock;
    auto r = UploadFile(mock, tmp.Root(), "docs/a.txt");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
}

TEST_CASE("UploadFile: failure status becomes an error", "[storage][transfer]") {
    TempDir tmp;
    const auto local = tmp.WriteFile("a.txt", "hello");
    MockStorageClient mock;
    mock.EnqueuePut(OkResponse(403, "Forbidden"));

    auto r = UploadFile(mock, local, "a.txt");
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "Upload");
    CHECK(r.Error().endpoint == "a.txt");
    CHECK(r.Error().http_status == 403);
    CHECK(r.Error().category == ErrorCategory::Authentication);
}

// ===========================================================================
// DownloadFile / DownloadFolder
// ===========================================================================

TEST_CASE("DownloadFile: default local name", "[storage][transfer]") {
    MockStorageClient mock;
    mock.EnqueueGetToFile(Result<DownloadResponse, Error>::Ok({200, 42, ""}));

    auto r = DownloadFile(mock, "docs/a.txt");
    REQUIRE(r.IsOk());
    CHECK(r.Value().local_path == "docs_a.txt");
    CHECK(r.Value().size_bytes == 42);
    CHECK(r.Value().status_code == 200);

    auto calls = mock.GetToFileCalls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].path == "docs/a.txt");
    CHECK(calls[0].local_file == "docs_a.txt");
}

TEST_CASE("DownloadFile: not found maps to NotFound", "[storage][transfer]") {
    MockStorageClient mock;
    mock.EnqueueGetToFile(Result<DownloadResponse, Error>::Ok({404, 0, "Not Found"}));

    auto r = DownloadFile(mock, "nope.txt", "/tmp/x");
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "Download");
    CHECK(r.Error().category == ErrorCategory::NotFound);
    CHECK(r.Error().http_status == 404);
}

TEST_CASE("DownloadFolder: requests zip with .zip default name", "[storage][transfer]") {
    MockStorageClient mock;
    mock.EnqueueGetToFile(Result<DownloadResponse, Error>::Ok({200, 1024, ""}));

    auto r = DownloadFolder(mock, "docs/sub");
    REQUIRE(r.IsOk());
    CHECK(r.Value().local_path == "docs_sub.zip");

    auto calls = mock.GetToFileCalls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].path == "docs/sub?zip");
}

TEST_CASE("DownloadFolder: transport error passes through", "[storage][transfer]") {
    MockStorageClient mock;
    mock.EnqueueGetToFile(Result<DownloadResponse, Error>::Err(
        Error{"GetToFile", "docs", std::nullopt, "HTTP request failed: Connection",
              ErrorCategory::Connection}));

    auto r = DownloadFolder(mock, "docs", "out.zip");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Connection);
}
