#include <dufs_mcp/storage/transfer.hpp>

#include <dufs_mcp/core/log.hpp>
#include <dufs_mcp/storage/remote_path.hpp>

#include <filesystem>

namespace dufs_mcp {

namespace {

Result<DownloadResult, Error> Fetch(IStorageClient& client,
                                    const std::string& operation,
                                    const std::string& remote_path,
                                    const std::string& target,
                                    const std::string& local_path) {
    auto res = client.GetToFile(target, local_path);
    if (res.IsErr()) {
        return Result<DownloadResult, Error>::Err(std::move(res).Error());
    }
    const auto& response = res.Value();
    if (response.status_code >= 400) {
        return Result<DownloadResult, Error>::Err(Error::FromHttpStatus(
            operation, remote_path, response.status_code, response.error_body));
    }
    LogInfo("storage", "Downloaded " + remote_path + " to " + local_path + " (" +
                           std::to_string(response.bytes_written) + " bytes)");
    return Result<DownloadResult, Error>::Ok(
        DownloadResult{local_path, response.bytes_written, response.status_code});
}

} // anonymous namespace

Result<void, Error> EnsureRemoteDirectories(IStorageClient& client,
                                            std::string_view remote_path) {
    for (const auto& dir : ParentCollections(remote_path)) {
        auto res = client.MakeCollection(dir);
        if (res.IsErr()) {
            auto error = std::move(res).Error();
            error.message = "Failed to create remote directory " + dir + ": " +
                            error.message;
            return Result<void, Error>::Err(std::move(error));
        }
    }
    return Result<void, Error>::Ok();
}

Result<UploadResult, Error> UploadFile(IStorageClient& client,
                                       const std::string& local_path,
                                       const std::string& remote_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(local_path, ec)) {
        return Result<UploadResult, Error>::Err(Error{
            "Upload", local_path, std::nullopt,
            "Failed to open file: not a regular file or does not exist",
            ErrorCategory::Io});
    }

    auto dirs = EnsureRemoteDirectories(client, remote_path);
    if (dirs.IsErr()) {
        return Result<UploadResult, Error>::Err(std::move(dirs).Error());
    }

    auto res = client.PutFile(remote_path, local_path);
    if (res.IsErr()) {
        return Result<UploadResult, Error>::Err(std::move(res).Error());
    }
    const auto& response = res.Value();
    if (response.status_code >= 400) {
        return Result<UploadResult, Error>::Err(Error::FromHttpStatus(
            "Upload", remote_path, response.status_code, response.body));
    }
    LogInfo("storage", "Uploaded " + local_path + " to " + remote_path);
    return Result<UploadResult, Error>::Ok(
        UploadResult{remote_path, response.status_code});
}

Result<DownloadResult, Error> DownloadFile(IStorageClient& client,
                                           const std::string& remote_path,
                                           const std::string& local_path) {
    const auto dest = local_path.empty() ? DefaultLocalName(remote_path) : local_path;
    return Fetch(client, "Download", remote_path, remote_path, dest);
}

Result<DownloadResult, Error> DownloadFolder(IStorageClient& client,
                                             const std::string& remote_path,
                                             const std::string& local_path) {
    const auto dest = local_path.empty()
                          ? DefaultLocalName(remote_path) + ".zip"
                          : local_path;
    return Fetch(client, "DownloadFolder", remote_path, remote_path + "?zip", dest);
}

} // namespace dufs_mcp
