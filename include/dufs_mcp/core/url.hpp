#pragma once

#include <dufs_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace dufs_mcp {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Percent-encode each '/'-separated segment of a path, keeping the slashes.
// "docs/my file.txt" -> "docs/my%20file.txt"
std::string EncodePath(std::string_view path);

// ---------------------------------------------------------------------------
// BaseUrl: the parts of the configured dufs URL that httplib needs apart.
// dufs is often served under a prefix (--path-prefix), so `path_prefix`
// is kept and prepended to every request path.
// ---------------------------------------------------------------------------
struct BaseUrl {
    std::string scheme;       // "http" or "https"
    std::string host;
    uint16_t port = 80;
    std::string path_prefix;  // "" or "/prefix" (no trailing slash)

    /// "http://host:port": what httplib::Client wants.
    [[nodiscard]] std::string Origin() const;
};

Result<BaseUrl, Error> ParseBaseUrl(std::string_view url);

} // namespace dufs_mcp
