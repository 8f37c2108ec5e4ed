#include <dufs_mcp/transport/http_transport.hpp>

#include <dufs_mcp/core/log.hpp>

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace dufs_mcp {

namespace {

constexpr const char* kMessagePath = "/message";
constexpr const char* kSsePath = "/sse";
constexpr const char* kConnectedEvent =
    "data: {\"type\":\"connection\",\"status\":\"connected\"}\n\n";
constexpr auto kSsePollInterval = std::chrono::milliseconds(100);

Error ListenError(const std::string& endpoint, const std::string& message) {
    return Error{"HttpTransport", endpoint, std::nullopt, message,
                 ErrorCategory::Connection};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: owns the httplib server and its routes.
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    const McpServer& server;
    HttpTransportOptions options;
    httplib::Server http;
    std::atomic<bool> stopping{false};

    Impl(const McpServer& srv, HttpTransportOptions opts)
        : server(srv), options(std::move(opts)) {
        http.set_default_headers({
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
            {"Access-Control-Allow-Headers", "Content-Type"},
        });

        http.Post(kMessagePath, [this](const httplib::Request& req,
                                       httplib::Response& res) {
            HandleMessage(req, res);
        });
        http.Options(kMessagePath, [](const httplib::Request&,
                                      httplib::Response& res) {
            res.status = 200;
        });
        const auto not_allowed = [](const httplib::Request&, httplib::Response& res) {
            res.status = 405;
            res.set_content("Method not allowed", "text/plain");
        };
        http.Get(kMessagePath, not_allowed);
        http.Put(kMessagePath, not_allowed);
        http.Patch(kMessagePath, not_allowed);
        http.Delete(kMessagePath, not_allowed);

        http.Get(kSsePath, [this](const httplib::Request&, httplib::Response& res) {
            HandleSse(res);
        });

        http.set_exception_handler([](const httplib::Request& req,
                                      httplib::Response& res,
                                      std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            }
            LogError("http", req.method + " " + req.path + " failed: " + what);
            res.status = 500;
            res.set_content("Internal server error", "text/plain");
        });

        http.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            if (LogEnabled(LogLevel::Debug)) {
                LogDebug("http", req.method + " " + req.path + " -> " +
                                     std::to_string(res.status));
            }
        });
    }

    void HandleMessage(const httplib::Request& req, httplib::Response& res) const {
        auto decoded = DecodeEnvelope(req.body);
        if (decoded.IsErr()) {
            res.status = 400;
            res.set_content("Invalid JSON: " + decoded.Error().message, "text/plain");
            return;
        }

        auto response = server.HandleEnvelope(decoded.Value());
        if (!response) {
            res.status = 202;
            return;
        }
        res.status = 200;
        res.set_content(response->dump(-1, ' ', false,
                                       nlohmann::json::error_handler_t::replace),
                        "application/json");
    }

    void HandleSse(httplib::Response& res) {
        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this](size_t /*offset*/, httplib::DataSink& sink) {
                if (!sink.write(kConnectedEvent, std::char_traits<char>::length(kConnectedEvent))) {
                    return false;
                }
                LogDebug("http", "Event stream client connected");
                while (!stopping.load() && sink.is_writable()) {
                    std::this_thread::sleep_for(kSsePollInterval);
                }
                LogDebug("http", "Event stream closed");
                sink.done();
                return true;
            });
    }

    std::string Endpoint() const {
        return options.host + ":" + std::to_string(options.port);
    }
};

// ---------------------------------------------------------------------------
// HttpTransport
// ---------------------------------------------------------------------------
HttpTransport::HttpTransport(const McpServer& server, HttpTransportOptions options)
    : impl_(std::make_unique<Impl>(server, std::move(options))) {}

HttpTransport::~HttpTransport() {
    Stop();
}

Result<void, Error> HttpTransport::Listen() {
    LogInfo("http", "Listening on " + impl_->Endpoint() +
                        " (POST /message, GET /sse)");
    if (!impl_->http.listen(impl_->options.host, impl_->options.port)) {
        if (impl_->stopping.load()) {
            return Result<void, Error>::Ok();
        }
        return Result<void, Error>::Err(
            ListenError(impl_->Endpoint(), "failed to bind or listen"));
    }
    return Result<void, Error>::Ok();
}

Result<int, Error> HttpTransport::BindToAnyPort() {
    const int port = impl_->http.bind_to_any_port(impl_->options.host);
    if (port < 0) {
        return Result<int, Error>::Err(
            ListenError(impl_->options.host, "failed to bind to any port"));
    }
    impl_->options.port = port;
    return Result<int, Error>::Ok(port);
}

Result<void, Error> HttpTransport::ListenAfterBind() {
    if (!impl_->http.listen_after_bind()) {
        if (impl_->stopping.load()) {
            return Result<void, Error>::Ok();
        }
        return Result<void, Error>::Err(
            ListenError(impl_->Endpoint(), "listener failed"));
    }
    return Result<void, Error>::Ok();
}

void HttpTransport::WaitUntilReady() {
    impl_->http.wait_until_ready();
}

void HttpTransport::Stop() {
    if (impl_->stopping.exchange(true)) {
        return;
    }
    impl_->http.stop();
    LogInfo("http", "Stopped");
}

} // namespace dufs_mcp
