#include <dufs_mcp/storage/storage_client.hpp>

#include <dufs_mcp/core/log.hpp>

#include <httplib.h>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <vector>

namespace dufs_mcp {

namespace {

constexpr size_t kUploadChunkSize = 64 * 1024;
constexpr size_t kMaxErrorBody = 4096;
constexpr const char* kOctetStream = "application/octet-stream";

Error MakeClientError(const std::string& operation,
                      const std::string& endpoint,
                      const std::string& message,
                      ErrorCategory category = ErrorCategory::Connection) {
    return Error{operation, endpoint, std::nullopt, message, category};
}

ErrorCategory CategoryFromTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Read:
        case httplib::Error::Write:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

Error TransportError(const std::string& operation, const std::string& endpoint,
                     httplib::Error error) {
    return MakeClientError(operation, endpoint,
                           "HTTP request failed: " + httplib::to_string(error),
                           CategoryFromTransportError(error));
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

std::string_view StripLeadingSlashes(std::string_view path) {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    return path;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the connection pool and settings.
// ---------------------------------------------------------------------------
struct DufsStorageClient::Impl {
    BaseUrl base;
    StorageClientOptions options;
    std::mutex pool_mutex;
    std::vector<std::unique_ptr<httplib::Client>> idle;

    Impl(BaseUrl base_url, StorageClientOptions opts)
        : base(std::move(base_url)), options(std::move(opts)) {}

    // RAII lease on one pooled client. A client whose request failed at the
    // transport level is discarded instead of going back to the pool.
    struct Lease {
        Impl& owner;
        std::unique_ptr<httplib::Client> client;
        bool healthy = true;

        ~Lease() {
            if (client && healthy) {
                owner.Release(std::move(client));
            }
        }

        httplib::Client* operator->() { return client.get(); }
    };

    std::unique_ptr<httplib::Client> NewClient() const {
        auto client = std::make_unique<httplib::Client>(base.Origin());
        if (!options.username.empty() && !options.password.empty()) {
            client->set_basic_auth(options.username, options.password);
        }
        client->set_connection_timeout(options.timeout);
        client->set_read_timeout(options.timeout);
        client->set_write_timeout(options.timeout);
        client->set_keep_alive(true);
        // Paths are percent-encoded by Target().
        client->set_url_encode(false);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (options.allow_insecure) {
            client->enable_server_certificate_verification(false);
        }
#endif
        return client;
    }

    Result<std::unique_ptr<httplib::Client>, Error> Acquire(
            const std::string& operation, const std::string& endpoint) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            if (!idle.empty()) {
                auto client = std::move(idle.back());
                idle.pop_back();
                return Result<std::unique_ptr<httplib::Client>, Error>::Ok(
                    std::move(client));
            }
        }
        auto client = NewClient();
        if (!client->is_valid()) {
            return Result<std::unique_ptr<httplib::Client>, Error>::Err(
                MakeClientError(operation, endpoint,
                                "Cannot create HTTP client for " + base.Origin() +
                                    " (HTTPS requires a TLS-enabled build)",
                                ErrorCategory::Internal));
        }
        return Result<std::unique_ptr<httplib::Client>, Error>::Ok(
            std::move(client));
    }

    void Release(std::unique_ptr<httplib::Client> client) {
        std::lock_guard<std::mutex> lock(pool_mutex);
        if (idle.size() < options.max_idle_connections) {
            idle.push_back(std::move(client));
        }
    }

    // Request target: prefix + encoded path + verbatim query suffix.
    std::string Target(std::string_view path) const {
        path = StripLeadingSlashes(path);
        std::string_view query;
        const auto q = path.find('?');
        if (q != std::string_view::npos) {
            query = path.substr(q);
            path = path.substr(0, q);
        }
        return base.path_prefix + "/" + EncodePath(path) + std::string(query);
    }

    static void LogResponse(const std::string& method, const std::string& target,
                            int status) {
        if (LogEnabled(LogLevel::Debug)) {
            LogDebug("storage", method + " " + target + " -> " + std::to_string(status));
        }
    }

    Result<HttpResponse, Error> Send(const std::string& operation,
                                     const std::string& method,
                                     std::string_view path,
                                     const httplib::Headers& headers) {
        const auto target = Target(path);
        auto acquired = Acquire(operation, std::string(path));
        if (acquired.IsErr()) {
            return Result<HttpResponse, Error>::Err(std::move(acquired).Error());
        }
        Lease lease{*this, std::move(acquired).Value()};

        httplib::Request req;
        req.method = method;
        req.path = target;
        req.headers = headers;

        auto res = lease->send(req);
        if (!res) {
            lease.healthy = false;
            return Result<HttpResponse, Error>::Err(
                TransportError(operation, std::string(path), res.error()));
        }
        LogResponse(method, target, res->status);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

// ---------------------------------------------------------------------------
// DufsStorageClient
// ---------------------------------------------------------------------------
DufsStorageClient::DufsStorageClient(BaseUrl base_url, StorageClientOptions options)
    : impl_(std::make_unique<Impl>(std::move(base_url), std::move(options))) {}

DufsStorageClient::~DufsStorageClient() = default;

Result<HttpResponse, Error> DufsStorageClient::Get(std::string_view path) {
    return impl_->Send("Get", "GET", path, {});
}

Result<DownloadResponse, Error> DufsStorageClient::GetToFile(
        std::string_view path, const std::string& local_file) {
    const std::string endpoint(path);
    const auto target = impl_->Target(path);
    auto acquired = impl_->Acquire("GetToFile", endpoint);
    if (acquired.IsErr()) {
        return Result<DownloadResponse, Error>::Err(std::move(acquired).Error());
    }
    Impl::Lease lease{*impl_, std::move(acquired).Value()};

    DownloadResponse out;
    std::ofstream file;
    bool file_opened = false;
    std::optional<std::string> io_error;

    auto res = lease->Get(
        target, httplib::Headers{},
        [&](const httplib::Response& response) {
            out.status_code = response.status;
            if (response.status >= 400) {
                return true;
            }
            file.open(local_file, std::ios::binary | std::ios::trunc);
            if (!file) {
                io_error = "Cannot open local file for writing: " + local_file;
                return false;
            }
            file_opened = true;
            return true;
        },
        [&](const char* data, size_t length) {
            if (out.status_code >= 400) {
                if (out.error_body.size() < kMaxErrorBody) {
                    out.error_body.append(data, length);
                }
                return true;
            }
            file.write(data, static_cast<std::streamsize>(length));
            if (!file) {
                io_error = "Failed writing local file: " + local_file;
                return false;
            }
            out.bytes_written += length;
            return true;
        });

    const auto discard_partial = [&] {
        if (file_opened) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(local_file, ec);
        }
    };

    if (io_error.has_value()) {
        discard_partial();
        return Result<DownloadResponse, Error>::Err(
            MakeClientError("GetToFile", local_file, *io_error, ErrorCategory::Io));
    }
    if (!res) {
        lease.healthy = false;
        discard_partial();
        return Result<DownloadResponse, Error>::Err(
            TransportError("GetToFile", endpoint, res.error()));
    }
    Impl::LogResponse("GET", target, res->status);

    if (file_opened) {
        file.close();
        if (!file) {
            return Result<DownloadResponse, Error>::Err(MakeClientError(
                "GetToFile", local_file, "Failed to finish writing local file",
                ErrorCategory::Io));
        }
    }
    return Result<DownloadResponse, Error>::Ok(std::move(out));
}

Result<HttpResponse, Error> DufsStorageClient::PutFile(
        std::string_view path, const std::string& local_file) {
    const std::string endpoint(path);

    std::error_code ec;
    const auto size = std::filesystem::file_size(local_file, ec);
    if (ec) {
        return Result<HttpResponse, Error>::Err(MakeClientError(
            "PutFile", local_file, "Failed to open file: " + ec.message(),
            ErrorCategory::Io));
    }
    std::ifstream file(local_file, std::ios::binary);
    if (!file) {
        return Result<HttpResponse, Error>::Err(MakeClientError(
            "PutFile", local_file, "Failed to open file", ErrorCategory::Io));
    }

    const auto target = impl_->Target(path);
    auto acquired = impl_->Acquire("PutFile", endpoint);
    if (acquired.IsErr()) {
        return Result<HttpResponse, Error>::Err(std::move(acquired).Error());
    }
    Impl::Lease lease{*impl_, std::move(acquired).Value()};

    LogDebug("storage", "PUT " + target + " (" + std::to_string(size) + " bytes)");
    std::vector<char> buffer(kUploadChunkSize);
    bool read_failed = false;
    auto res = lease->Put(
        target, httplib::Headers{}, static_cast<size_t>(size),
        [&](size_t offset, size_t length, httplib::DataSink& sink) {
            file.clear();
            file.seekg(static_cast<std::streamoff>(offset));
            const auto chunk = std::min(length, buffer.size());
            file.read(buffer.data(), static_cast<std::streamsize>(chunk));
            const auto got = static_cast<size_t>(file.gcount());
            if (got == 0) {
                read_failed = true;
                return false;
            }
            return sink.write(buffer.data(), got);
        },
        kOctetStream);

    if (read_failed) {
        return Result<HttpResponse, Error>::Err(MakeClientError(
            "PutFile", local_file, "Failed reading local file during upload",
            ErrorCategory::Io));
    }
    if (!res) {
        lease.healthy = false;
        return Result<HttpResponse, Error>::Err(
            TransportError("PutFile", endpoint, res.error()));
    }
    Impl::LogResponse("PUT", target, res->status);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

Result<HttpResponse, Error> DufsStorageClient::Delete(std::string_view path) {
    return impl_->Send("Delete", "DELETE", path, {});
}

Result<CollectionResult, Error> DufsStorageClient::MakeCollection(
        std::string_view path) {
    auto res = impl_->Send("MakeCollection", "MKCOL", path, {});
    if (res.IsErr()) {
        return Result<CollectionResult, Error>::Err(std::move(res).Error());
    }
    const auto& response = res.Value();
    // dufs answers MKCOL on an existing directory with 405.
    if (response.status_code == 405) {
        return Result<CollectionResult, Error>::Ok(
            CollectionResult{CollectionStatus::AlreadyExists, response.status_code});
    }
    if (response.status_code >= 400) {
        return Result<CollectionResult, Error>::Err(Error::FromHttpStatus(
            "MakeCollection", std::string(path), response.status_code,
            response.body));
    }
    return Result<CollectionResult, Error>::Ok(
        CollectionResult{CollectionStatus::Created, response.status_code});
}

Result<HttpResponse, Error> DufsStorageClient::Move(std::string_view source,
                                                    std::string_view destination) {
    httplib::Headers headers{{"Destination", ResourceUrl(destination)}};
    return impl_->Send("Move", "MOVE", source, headers);
}

std::string DufsStorageClient::ResourceUrl(std::string_view path) const {
    return impl_->base.Origin() + impl_->Target(path);
}

} // namespace dufs_mcp
