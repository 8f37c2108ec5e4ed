#include <dufs_mcp/storage/remote_path.hpp>

#include <algorithm>

namespace dufs_mcp {

namespace {

std::string_view TrimSlashes(std::string_view s) {
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return s;
}

std::string_view BaseName(std::string_view path) {
    while (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
        path.remove_suffix(1);
    }
    const auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

} // anonymous namespace

std::string ResolveRemotePath(std::string_view local_path,
                              std::string_view requested,
                              std::string_view upload_dir,
                              Timestamp now) {
    if (!requested.empty()) {
        std::string normalised(requested);
        std::replace(normalised.begin(), normalised.end(), '\\', '/');
        const auto first = normalised.find_first_not_of('/');
        if (first == std::string::npos) {
            return "";
        }
        return normalised.substr(first);
    }

    auto dir = TrimSlashes(upload_dir);
    if (dir.empty()) {
        dir = kDefaultUploadDir;
    }
    return std::string(dir) + "/" + FormatDateStamp(now) + "/" +
           std::string(BaseName(local_path));
}

std::vector<std::string> ParentCollections(std::string_view remote_path) {
    std::vector<std::string> prefixes;
    remote_path = TrimSlashes(remote_path);
    const auto last = remote_path.rfind('/');
    if (last == std::string_view::npos) {
        return prefixes;
    }
    const auto parent = remote_path.substr(0, last);

    size_t pos = 0;
    while (pos <= parent.size()) {
        const auto next = parent.find('/', pos);
        const auto end = next == std::string_view::npos ? parent.size() : next;
        // Skip empty segments from doubled slashes.
        if (end > pos) {
            prefixes.emplace_back(parent.substr(0, end));
        }
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }
    return prefixes;
}

std::string DefaultLocalName(std::string_view remote_path) {
    if (!remote_path.empty() && remote_path.front() == '/') {
        remote_path.remove_prefix(1);
    }
    if (remote_path.substr(0, 2) == "./") {
        remote_path.remove_prefix(2);
    }
    std::string name(remote_path);
    std::replace(name.begin(), name.end(), '/', '_');
    return name;
}

} // namespace dufs_mcp
