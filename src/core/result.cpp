#include <dufs_mcp/core/result.hpp>

namespace dufs_mcp {

namespace {

constexpr size_t kMaxBodyInMessage = 512;

// dufs answers errors with short plain-text bodies. Collapse whitespace at
// the edges and cap the length so a misconfigured proxy returning an HTML
// page does not flood the tool response.
std::string SummarizeBody(const std::string& body) {
    const auto first = body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = body.find_last_not_of(" \t\r\n");
    auto trimmed = body.substr(first, last - first + 1);
    if (trimmed.size() > kMaxBodyInMessage) {
        trimmed = trimmed.substr(0, kMaxBodyInMessage) + "...";
    }
    return trimmed;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::InvalidArgument;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed, check DUFS_USERNAME and DUFS_PASSWORD";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = "Forbidden, the account lacks permission for this path";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 405:
            category = ErrorCategory::AlreadyExists;
            message = "Method not allowed";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 409:
            category = ErrorCategory::Storage;
            message = "Conflict, a parent directory may be missing";
            break;
        case 413:
            category = ErrorCategory::Storage;
            message = "Payload too large";
            break;
        case 500:
            category = ErrorCategory::Storage;
            message = "dufs server internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "dufs server unavailable";
            break;
        default:
            category = ErrorCategory::Storage;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    auto detail = SummarizeBody(response_body);
    if (!detail.empty()) {
        message += ": " + detail;
    }

    return Error{operation, endpoint, status_code, message, category};
}

} // namespace dufs_mcp
