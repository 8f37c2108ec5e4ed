#include <dufs_mcp/transport/stdio_transport.hpp>

#include <dufs_mcp/core/log.hpp>

#include <string>

namespace dufs_mcp {

namespace {

std::string_view Trim(std::string_view s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

Error StreamError(const std::string& message) {
    return Error{"StdioTransport", "", std::nullopt, message, ErrorCategory::Io};
}

} // anonymous namespace

StdioTransport::StdioTransport(const McpServer& server,
                               std::istream& in,
                               std::ostream& out)
    : server_(server), in_(in), out_(out) {}

Result<void, Error> StdioTransport::Run() {
    LogInfo("stdio", "Serving MCP over stdin/stdout");

    std::string line;
    while (std::getline(in_, line)) {
        const auto message = Trim(line);
        if (message.empty()) {
            continue;
        }

        auto response = server_.HandleLine(message);
        if (!response) {
            continue;
        }
        out_ << response->dump(-1, ' ', false,
                               nlohmann::json::error_handler_t::replace)
             << "\n";
        out_.flush();
        if (!out_) {
            return Result<void, Error>::Err(StreamError("failed to write response"));
        }
    }

    if (in_.bad()) {
        return Result<void, Error>::Err(StreamError("failed to read from input"));
    }
    LogInfo("stdio", "Input closed, shutting down");
    return Result<void, Error>::Ok();
}

} // namespace dufs_mcp
