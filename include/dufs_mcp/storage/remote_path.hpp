#pragma once

#include <dufs_mcp/core/time.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dufs_mcp {

/// Upload directory used when none is configured.
inline constexpr const char* kDefaultUploadDir = "uploads";

/// Remote path for an upload. A non-empty `requested` path wins, with '\'
/// normalised to '/' and leading slashes removed. Otherwise the file goes to
/// `<upload_dir>/<YYYYMMDD>/<basename of local_path>`, dated by `now` in
/// local time.
std::string ResolveRemotePath(std::string_view local_path,
                              std::string_view requested,
                              std::string_view upload_dir,
                              Timestamp now);

/// Cumulative prefixes of the parent directory, shallowest first:
/// "a/b/c/f.txt" -> {"a", "a/b", "a/b/c"}. Empty for a top-level file.
std::vector<std::string> ParentCollections(std::string_view remote_path);

/// Local file name for a download when the caller gave none: the remote
/// path without leading "/" or "./", with '/' replaced by '_'.
std::string DefaultLocalName(std::string_view remote_path);

} // namespace dufs_mcp
