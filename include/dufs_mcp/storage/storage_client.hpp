#pragma once

#include <dufs_mcp/core/url.hpp>
#include <dufs_mcp/storage/i_storage_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// StorageClientOptions: connection settings for the dufs HTTP client.
// ---------------------------------------------------------------------------
struct StorageClientOptions {
    std::string username;
    std::string password;
    std::chrono::seconds timeout{30};
    bool allow_insecure = false;  // skip TLS certificate verification
    size_t max_idle_connections = 4;
};

// ---------------------------------------------------------------------------
// DufsStorageClient: concrete IStorageClient implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header.
//
// Features:
//   - Basic Auth when both username and password are set
//   - Path prefix support (dufs --path-prefix) and per-segment encoding
//   - One timeout bounding connect, read and write of every call
//   - Files streamed in both directions, never loaded whole into memory
//   - A small pool of idle httplib::Client instances, so a long upload in
//     a background job does not hold up a synchronous tool call
// ---------------------------------------------------------------------------
class DufsStorageClient : public IStorageClient {
public:
    DufsStorageClient(BaseUrl base_url, StorageClientOptions options = {});

    ~DufsStorageClient() override;

    DufsStorageClient(const DufsStorageClient&) = delete;
    DufsStorageClient& operator=(const DufsStorageClient&) = delete;
    DufsStorageClient(DufsStorageClient&&) = delete;
    DufsStorageClient& operator=(DufsStorageClient&&) = delete;

    // -- IStorageClient implementation ---------------------------------------

    [[nodiscard]] Result<HttpResponse, Error> Get(std::string_view path) override;

    [[nodiscard]] Result<DownloadResponse, Error> GetToFile(
        std::string_view path,
        const std::string& local_file) override;

    [[nodiscard]] Result<HttpResponse, Error> PutFile(
        std::string_view path,
        const std::string& local_file) override;

    [[nodiscard]] Result<HttpResponse, Error> Delete(std::string_view path) override;

    [[nodiscard]] Result<CollectionResult, Error> MakeCollection(
        std::string_view path) override;

    [[nodiscard]] Result<HttpResponse, Error> Move(
        std::string_view source,
        std::string_view destination) override;

    [[nodiscard]] std::string ResourceUrl(std::string_view path) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dufs_mcp
