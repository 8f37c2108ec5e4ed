#pragma once

#include <dufs_mcp/core/result.hpp>
#include <dufs_mcp/storage/i_storage_client.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// UploadResult: where a file landed and what dufs answered.
// ---------------------------------------------------------------------------
struct UploadResult {
    std::string remote_path;
    int status_code = 0;
};

// ---------------------------------------------------------------------------
// DownloadResult: a remote file or zipped folder written to local disk.
// ---------------------------------------------------------------------------
struct DownloadResult {
    std::string local_path;
    std::uint64_t size_bytes = 0;
    int status_code = 0;
};

/// Create every parent directory of `remote_path`, shallowest first.
/// A directory that already exists counts as success; the first other
/// failure stops the walk.
[[nodiscard]] Result<void, Error> EnsureRemoteDirectories(
    IStorageClient& client,
    std::string_view remote_path);

/// Upload a local regular file to `remote_path` (already resolved),
/// creating its parent directories first.
[[nodiscard]] Result<UploadResult, Error> UploadFile(
    IStorageClient& client,
    const std::string& local_path,
    const std::string& remote_path);

/// Download one file. An empty `local_path` selects DefaultLocalName().
[[nodiscard]] Result<DownloadResult, Error> DownloadFile(
    IStorageClient& client,
    const std::string& remote_path,
    const std::string& local_path = "");

/// Download a directory as a zip archive (dufs "?zip"). An empty
/// `local_path` selects DefaultLocalName() + ".zip".
[[nodiscard]] Result<DownloadResult, Error> DownloadFolder(
    IStorageClient& client,
    const std::string& remote_path,
    const std::string& local_path = "");

} // namespace dufs_mcp
