#include <dufs_mcp/mcp/envelope.hpp>

namespace dufs_mcp {

namespace {

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

Result<Envelope, DecodeFailure> Fail(const nlohmann::json& id, std::string message) {
    return Result<Envelope, DecodeFailure>::Err(
        DecodeFailure{id, std::move(message)});
}

} // anonymous namespace

Result<Envelope, DecodeFailure> DecodeEnvelope(std::string_view raw) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(raw.begin(), raw.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Fail(nullptr, e.what());
    }

    if (!doc.is_object()) {
        return Fail(nullptr, "message is not a JSON object");
    }

    // Recover the id first so that a malformed message can still be
    // answered against the request that sent it.
    nlohmann::json id = nullptr;
    if (auto it = doc.find("id"); it != doc.end()) {
        if (!IsValidId(*it)) {
            // Echoed back so the caller can still correlate the error.
            return Fail(*it, "id must be a string, number or null");
        }
        id = *it;
    }

    if (auto it = doc.find("jsonrpc"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>() != "2.0") {
            return Fail(id, "unsupported jsonrpc version");
        }
    }

    Envelope env;
    env.id = id;

    if (auto it = doc.find("method"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Fail(id, "method must be a string");
        }
        env.method = it->get<std::string>();
    }

    if (auto it = doc.find("params"); it != doc.end()) {
        if (!it->is_object() && !it->is_array() && !it->is_null()) {
            return Fail(id, "params must be an object or array");
        }
        env.params = *it;
    }

    return Result<Envelope, DecodeFailure>::Ok(std::move(env));
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace dufs_mcp
