#include <dufs_mcp/mcp/mcp_server.hpp>

#include <dufs_mcp/core/log.hpp>
#include <dufs_mcp/core/version.hpp>

#include <optional>
#include <string>

namespace dufs_mcp {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "dufs-mcp-server";

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry)
    : registry_(std::move(registry)) {}

std::optional<nlohmann::json> McpServer::HandleLine(std::string_view raw) const {
    auto decoded = DecodeEnvelope(raw);
    if (decoded.IsErr()) {
        const auto& failure = decoded.Error();
        const auto message = "Parse error: " + failure.message;
        LogWarn("mcp", message);
        return MakeError(failure.id, kParseError, message);
    }
    return HandleEnvelope(decoded.Value());
}

std::optional<nlohmann::json> McpServer::HandleEnvelope(const Envelope& envelope) const {
    const auto& id = envelope.id;

    if (envelope.method.empty()) {
        if (envelope.IsNotification()) {
            return std::nullopt;
        }
        return MakeError(id, kInvalidRequest, "Invalid Request: method is required");
    }

    LogDebug("mcp", "<- " + envelope.method +
                        (envelope.IsNotification() ? " (notification)" : ""));

    std::optional<nlohmann::json> response;
    if (envelope.method == "initialize") {
        response = HandleInitialize(id);
    } else if (envelope.method == "tools/list") {
        response = HandleToolsList(id);
    } else if (envelope.method == "tools/call") {
        response = HandleToolsCall(envelope.params, id);
    } else {
        response = MakeError(id, kApplicationError, "unknown method: " + envelope.method);
    }

    // Notifications are dispatched like requests; only the answer is dropped.
    if (envelope.IsNotification()) {
        return std::nullopt;
    }
    return response;
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) const {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id) const {
    if (!params.is_object()) {
        return MakeError(id, kApplicationError,
                         "invalid parameters: params must be an object");
    }
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string() ||
        name_it->get<std::string>().empty()) {
        return MakeError(id, kApplicationError,
                         "invalid parameters: name is required");
    }
    const auto tool_name = name_it->get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    if (auto args_it = params.find("arguments");
        args_it != params.end() && !args_it->is_null()) {
        arguments = *args_it;
    }

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, kApplicationError, "unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);
    if (result.IsErr()) {
        const auto text = result.Error().ToString();
        LogWarn("mcp", tool_name + " failed (" + result.Error().CategoryName() + "): " + text);
        return MakeError(id, kApplicationError, text);
    }

    nlohmann::json content = nlohmann::json::array({
        {{"type", "text"},
         {"text", result.Value().dump(-1, ' ', false,
                                      nlohmann::json::error_handler_t::replace)}}
    });
    return MakeResult(id, {{"content", content}, {"isError", false}});
}

} // namespace dufs_mcp
