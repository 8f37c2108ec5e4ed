#pragma once

#include <dufs_mcp/core/result.hpp>
#include <dufs_mcp/mcp/mcp_server.hpp>

#include <memory>
#include <string>

namespace dufs_mcp {

struct HttpTransportOptions {
    std::string host = "0.0.0.0";
    int port = 7887;
};

// ---------------------------------------------------------------------------
// HttpTransport: JSON-RPC over HTTP using cpp-httplib's server.
//
// Routes:
//   POST /message    one JSON-RPC message in, one response out (200), or
//                    202 with no body for a notification. A body that is
//                    not a valid message gets 400 text/plain.
//   OPTIONS /message CORS preflight (200).
//   GET /sse         event stream that announces the connection once and
//                    then stays open until the client leaves or Stop().
//
// Every response carries permissive CORS headers. Requests are served on
// httplib's thread pool, so McpServer is called concurrently.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    explicit HttpTransport(const McpServer& server, HttpTransportOptions options = {});
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Bind to options.host:options.port and serve until Stop().
    [[nodiscard]] Result<void, Error> Listen();

    // Bind options.host to a free port and return it; pair with
    // ListenAfterBind() on another thread.
    [[nodiscard]] Result<int, Error> BindToAnyPort();
    [[nodiscard]] Result<void, Error> ListenAfterBind();

    // Block until the listener accepts connections.
    void WaitUntilReady();

    // Close open event streams and stop the listener. Safe from any thread.
    void Stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dufs_mcp
