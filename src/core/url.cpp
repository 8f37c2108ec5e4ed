#include <dufs_mcp/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace dufs_mcp {

namespace {

Error MakeUrlError(std::string_view url, const std::string& message) {
    return Error{"ParseBaseUrl", std::string(url), std::nullopt, message,
                 ErrorCategory::InvalidArgument};
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string EncodePath(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    size_t start = 0;
    while (true) {
        const auto slash = path.find('/', start);
        const auto segment = path.substr(
            start, slash == std::string_view::npos ? std::string_view::npos
                                                   : slash - start);
        out += UrlEncode(segment);
        if (slash == std::string_view::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

std::string BaseUrl::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<BaseUrl, Error> ParseBaseUrl(std::string_view url) {
    BaseUrl base;

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<BaseUrl, Error>::Err(
            MakeUrlError(url, "URL must start with http:// or https://"));
    }
    std::string scheme(url.substr(0, scheme_end));
    for (auto& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (scheme != "http" && scheme != "https") {
        return Result<BaseUrl, Error>::Err(
            MakeUrlError(url, "Unsupported URL scheme: " + scheme));
    }
    base.scheme = scheme;
    base.port = scheme == "https" ? 443 : 80;

    auto rest = url.substr(scheme_end + 3);
    const auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        auto prefix = std::string(rest.substr(path_start));
        while (!prefix.empty() && prefix.back() == '/') {
            prefix.pop_back();
        }
        base.path_prefix = prefix;
    }

    // Credentials embedded in the URL are not supported; use the
    // username/password settings instead.
    if (authority.find('@') != std::string_view::npos) {
        return Result<BaseUrl, Error>::Err(
            MakeUrlError(url, "Credentials in the URL are not supported"));
    }

    const auto colon = authority.rfind(':');
    const auto bracket = authority.rfind(']');
    if (colon != std::string_view::npos &&
        (bracket == std::string_view::npos || colon > bracket)) {
        const auto port_str = std::string(authority.substr(colon + 1));
        if (port_str.empty() || port_str.size() > 5 ||
            port_str.find_first_not_of("0123456789") != std::string::npos) {
            return Result<BaseUrl, Error>::Err(
                MakeUrlError(url, "Invalid port: " + port_str));
        }
        const auto port = std::stoi(port_str);
        if (port <= 0 || port > 65535) {
            return Result<BaseUrl, Error>::Err(
                MakeUrlError(url, "Invalid port: " + port_str));
        }
        base.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return Result<BaseUrl, Error>::Err(MakeUrlError(url, "Missing host"));
    }
    base.host = std::string(authority);

    return Result<BaseUrl, Error>::Ok(std::move(base));
}

} // namespace dufs_mcp
