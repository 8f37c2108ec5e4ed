#pragma once

#include <dufs_mcp/core/result.hpp>
#include <dufs_mcp/storage/entries.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// Typed tool arguments.
//
// Each tools/call `arguments` object is parsed into one of these structs
// before the tool body runs. A missing or mistyped field yields an
// InvalidArgument error whose message names the field:
//   "Missing required parameter: files[2].local_path"
//   "Invalid parameter: async must be a boolean"
// Unknown fields are ignored.
// ---------------------------------------------------------------------------

struct UploadArgs {
    std::string local_path;
    std::string remote_path;  // empty: dated directory under upload_dir
    bool async = false;
};

struct BatchUploadEntry {
    std::string local_path;
    std::string remote_path;
};

struct BatchUploadArgs {
    std::vector<BatchUploadEntry> files;  // at least one
    bool async = true;
};

struct UploadStatusArgs {
    std::string job_id;
};

// dufs_download and dufs_download_folder.
struct DownloadArgs {
    std::string remote_path;
    std::string local_path;  // empty: derived from remote_path
};

// dufs_delete, dufs_create_dir and dufs_get_hash.
struct PathArgs {
    std::string path;
};

struct ListArgs {
    std::string path = "/";
    std::string query;
    ListFormat format = ListFormat::Default;
};

struct MoveArgs {
    std::string source;
    std::string destination;
};

[[nodiscard]] Result<UploadArgs, Error> ParseUploadArgs(const nlohmann::json& args);
[[nodiscard]] Result<BatchUploadArgs, Error> ParseBatchUploadArgs(const nlohmann::json& args);
[[nodiscard]] Result<UploadStatusArgs, Error> ParseUploadStatusArgs(const nlohmann::json& args);
[[nodiscard]] Result<DownloadArgs, Error> ParseDownloadArgs(const nlohmann::json& args);
[[nodiscard]] Result<PathArgs, Error> ParsePathArgs(const nlohmann::json& args);
[[nodiscard]] Result<ListArgs, Error> ParseListArgs(const nlohmann::json& args);
[[nodiscard]] Result<MoveArgs, Error> ParseMoveArgs(const nlohmann::json& args);

} // namespace dufs_mcp
