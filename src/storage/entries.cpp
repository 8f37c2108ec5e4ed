#include <dufs_mcp/storage/entries.hpp>

#include <dufs_mcp/core/log.hpp>
#include <dufs_mcp/core/url.hpp>

namespace dufs_mcp {

namespace {

constexpr const char* kHealthPath = "/__dufs__/health";

// Fetch a small response and turn a failure status into an Error.
Result<HttpResponse, Error> GetChecked(IStorageClient& client,
                                       const std::string& operation,
                                       const std::string& endpoint,
                                       const std::string& target) {
    auto res = client.Get(target);
    if (res.IsErr()) {
        return res;
    }
    if (res.Value().status_code >= 400) {
        return Result<HttpResponse, Error>::Err(Error::FromHttpStatus(
            operation, endpoint, res.Value().status_code, res.Value().body));
    }
    return res;
}

std::string Trim(const std::string& s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

Result<int, Error> DeleteEntry(IStorageClient& client, const std::string& path) {
    auto res = client.Delete(path);
    if (res.IsErr()) {
        return Result<int, Error>::Err(std::move(res).Error());
    }
    const auto& response = res.Value();
    if (response.status_code >= 400) {
        return Result<int, Error>::Err(Error::FromHttpStatus(
            "Delete", path, response.status_code, response.body));
    }
    LogInfo("storage", "Deleted " + path);
    return Result<int, Error>::Ok(response.status_code);
}

Result<CreateDirectoryResult, Error> CreateDirectory(IStorageClient& client,
                                                     const std::string& path) {
    auto res = client.MakeCollection(path);
    if (res.IsErr()) {
        return Result<CreateDirectoryResult, Error>::Err(std::move(res).Error());
    }
    const auto& created = res.Value();
    return Result<CreateDirectoryResult, Error>::Ok(CreateDirectoryResult{
        created.status == CollectionStatus::AlreadyExists, created.status_code});
}

Result<int, Error> MoveEntry(IStorageClient& client,
                             const std::string& source,
                             const std::string& destination) {
    auto res = client.Move(source, destination);
    if (res.IsErr()) {
        return Result<int, Error>::Err(std::move(res).Error());
    }
    const auto& response = res.Value();
    if (response.status_code >= 400) {
        return Result<int, Error>::Err(Error::FromHttpStatus(
            "Move", source, response.status_code, response.body));
    }
    LogInfo("storage", "Moved " + source + " to " + destination);
    return Result<int, Error>::Ok(response.status_code);
}

Result<std::string, Error> GetHash(IStorageClient& client, const std::string& path) {
    auto res = GetChecked(client, "GetHash", path, path + "?hash");
    if (res.IsErr()) {
        return Result<std::string, Error>::Err(std::move(res).Error());
    }
    return Result<std::string, Error>::Ok(Trim(res.Value().body));
}

std::string ListTarget(const std::string& path, const std::string& query,
                       ListFormat format) {
    std::string target = path.empty() ? "/" : path;
    char sep = '?';
    if (!query.empty()) {
        target += "?q=" + UrlEncode(query);
        sep = '&';
    }
    switch (format) {
        case ListFormat::Json:
            target += sep;
            target += "json";
            break;
        case ListFormat::Simple:
            target += sep;
            target += "simple";
            break;
        case ListFormat::Default:
            break;
    }
    return target;
}

Result<ListResult, Error> ListDirectory(IStorageClient& client,
                                        const std::string& path,
                                        const std::string& query,
                                        ListFormat format) {
    auto res = GetChecked(client, "List", path, ListTarget(path, query, format));
    if (res.IsErr()) {
        return Result<ListResult, Error>::Err(std::move(res).Error());
    }
    const auto& response = res.Value();

    ListResult out;
    out.status_code = response.status_code;
    if (format == ListFormat::Json) {
        auto parsed = nlohmann::json::parse(response.body, nullptr, false);
        if (parsed.is_discarded()) {
            return Result<ListResult, Error>::Err(Error{
                "List", path, response.status_code,
                "Failed to parse JSON listing", ErrorCategory::Storage});
        }
        out.data = std::move(parsed);
    } else {
        out.data = response.body;
    }
    return Result<ListResult, Error>::Ok(std::move(out));
}

Result<HealthResult, Error> CheckHealth(IStorageClient& client) {
    auto res = client.Get(kHealthPath);
    if (res.IsErr()) {
        return Result<HealthResult, Error>::Err(std::move(res).Error());
    }
    const int status = res.Value().status_code;
    if (status != 200) {
        LogWarn("storage", "Health check answered HTTP " + std::to_string(status));
    }
    return Result<HealthResult, Error>::Ok(HealthResult{status == 200, status});
}

} // namespace dufs_mcp
