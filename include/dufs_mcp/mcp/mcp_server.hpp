#pragma once

#include <dufs_mcp/mcp/envelope.hpp>
#include <dufs_mcp/mcp/tool_registry.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 request dispatcher.
//
// Transport-independent: the stdio and HTTP transports decode nothing
// themselves and hand each line or body to HandleLine().
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - tools/list
//   - tools/call
// Notifications (no id, or a null id) are processed but never answered.
//
// Thread-safe: the registry is only read after construction, so HTTP
// handler threads may call in concurrently.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry);

    // Decode and dispatch one raw message. A message that cannot be decoded
    // is always answered with a parse error.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(std::string_view raw) const;

    // Dispatch a decoded message. Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleEnvelope(
        const Envelope& envelope) const;

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id) const;
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id) const;

    ToolRegistry registry_;
};

} // namespace dufs_mcp
