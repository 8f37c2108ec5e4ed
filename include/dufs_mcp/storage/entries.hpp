#pragma once

#include <dufs_mcp/core/result.hpp>
#include <dufs_mcp/storage/i_storage_client.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace dufs_mcp {

// Listing formats dufs understands as query flags.
enum class ListFormat {
    Default,  // dufs' HTML index
    Json,
    Simple,
};

// ---------------------------------------------------------------------------
// Entry operation results.
// ---------------------------------------------------------------------------
struct CreateDirectoryResult {
    bool already_existed = false;
    int status_code = 0;
};

struct ListResult {
    nlohmann::json data;  // parsed object for ListFormat::Json, else the body text
    int status_code = 0;
};

struct HealthResult {
    bool healthy = false;
    int status_code = 0;
};

/// DELETE a file or directory. Returns the HTTP status.
[[nodiscard]] Result<int, Error> DeleteEntry(IStorageClient& client,
                                             const std::string& path);

/// MKCOL a single directory; an existing directory is not an error.
[[nodiscard]] Result<CreateDirectoryResult, Error> CreateDirectory(
    IStorageClient& client,
    const std::string& path);

/// MOVE `source` to `destination`. Returns the HTTP status.
[[nodiscard]] Result<int, Error> MoveEntry(IStorageClient& client,
                                           const std::string& source,
                                           const std::string& destination);

/// SHA-256 of a remote file as computed by dufs ("?hash").
[[nodiscard]] Result<std::string, Error> GetHash(IStorageClient& client,
                                                 const std::string& path);

/// List or search a directory. A non-empty `query` searches below `path`.
[[nodiscard]] Result<ListResult, Error> ListDirectory(IStorageClient& client,
                                                      const std::string& path,
                                                      const std::string& query,
                                                      ListFormat format);

/// GET the dufs health endpoint. Only a transport failure is an error.
[[nodiscard]] Result<HealthResult, Error> CheckHealth(IStorageClient& client);

/// Build the request path for ListDirectory ("docs?q=a%20b&json").
std::string ListTarget(const std::string& path, const std::string& query,
                       ListFormat format);

} // namespace dufs_mcp
