#pragma once

#include <dufs_mcp/core/result.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders: header name/value pairs as sent or received.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request whose body fits in memory.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// DownloadResponse: the result of a GET streamed straight to a local file.
// On a success status the body went to disk and `bytes_written` counts it;
// on status >= 400 nothing is written and `error_body` holds the body.
// ---------------------------------------------------------------------------
struct DownloadResponse {
    int status_code = 0;
    std::uint64_t bytes_written = 0;
    std::string error_body;
};

// ---------------------------------------------------------------------------
// CollectionStatus: outcome of a successful make-collection (MKCOL).
// ---------------------------------------------------------------------------
enum class CollectionStatus {
    Created,
    AlreadyExists,
};

struct CollectionResult {
    CollectionStatus status = CollectionStatus::Created;
    int status_code = 201;  // as answered by the server
};

// ---------------------------------------------------------------------------
// IStorageClient: abstract client for the dufs file-serving API.
//
// Remote paths are plain, unencoded paths relative to the server root
// ("uploads/20240305/a.txt"); a leading '/' is accepted and ignored. A path
// may carry a query suffix ("docs?json"), which is sent as-is.
//
// Every call is bounded by the client's request timeout. Methods return
// Result<T, Error>: a transport failure is an Err, while an HTTP status is
// reported in the response for the caller to judge. MakeCollection is the
// exception: it folds dufs' "already exists" answer into CollectionStatus
// (keeping the status code it came with) and reports any other failure
// status as an Err.
//
// Implementations must be safe to call from several threads at once.
// ---------------------------------------------------------------------------
class IStorageClient {
public:
    virtual ~IStorageClient() = default;

    IStorageClient(const IStorageClient&) = delete;
    IStorageClient& operator=(const IStorageClient&) = delete;
    IStorageClient(IStorageClient&&) = delete;
    IStorageClient& operator=(IStorageClient&&) = delete;

    // -- Fetch ---------------------------------------------------------------

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path) = 0;

    [[nodiscard]] virtual Result<DownloadResponse, Error> GetToFile(
        std::string_view path,
        const std::string& local_file) = 0;

    // -- Store / remove ------------------------------------------------------

    [[nodiscard]] virtual Result<HttpResponse, Error> PutFile(
        std::string_view path,
        const std::string& local_file) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Delete(
        std::string_view path) = 0;

    // -- Collections ---------------------------------------------------------

    [[nodiscard]] virtual Result<CollectionResult, Error> MakeCollection(
        std::string_view path) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Move(
        std::string_view source,
        std::string_view destination) = 0;

    // -- Addressing ----------------------------------------------------------

    /// Absolute URL of a remote path, as used in the MOVE Destination header.
    [[nodiscard]] virtual std::string ResourceUrl(std::string_view path) const = 0;

protected:
    IStorageClient() = default;
};

} // namespace dufs_mcp
