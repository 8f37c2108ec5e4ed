#pragma once

#include <dufs_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace dufs_mcp {

// JSON-RPC error codes used by this server.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kApplicationError = -32000;

// ---------------------------------------------------------------------------
// Envelope: one decoded JSON-RPC request or notification.
//
// `id` is a string, a number or null. A message whose id is absent or null
// is a notification and never gets a response.
// ---------------------------------------------------------------------------
struct Envelope {
    nlohmann::json id = nullptr;
    std::string method;
    nlohmann::json params = nullptr;

    [[nodiscard]] bool IsNotification() const { return id.is_null(); }
};

// ---------------------------------------------------------------------------
// DecodeFailure: why a line could not be decoded, plus whatever id could
// still be recovered from it (null otherwise; an id of the wrong type is
// returned as sent). `message` is the bare reason;
// each transport words the failure its own way.
// ---------------------------------------------------------------------------
struct DecodeFailure {
    nlohmann::json id = nullptr;
    std::string message;
};

[[nodiscard]] Result<Envelope, DecodeFailure> DecodeEnvelope(std::string_view raw);

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);

} // namespace dufs_mcp
