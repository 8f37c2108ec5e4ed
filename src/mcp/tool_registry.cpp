#include <dufs_mcp/mcp/tool_registry.hpp>

#include <dufs_mcp/core/log.hpp>

#include <stdexcept>

namespace dufs_mcp {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) > 0) {
        throw std::logic_error("tool registered twice: " + name);
    }
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<nlohmann::json, Error> ToolRegistry::Execute(
        const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<nlohmann::json, Error>::Err(Error{
            name, "", std::nullopt, "unknown tool: " + name,
            ErrorCategory::InvalidArgument});
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("mcp", "Tool " + name + " threw: " + e.what());
        return Result<nlohmann::json, Error>::Err(Error{
            name, "", std::nullopt, std::string("Tool error: ") + e.what(),
            ErrorCategory::Internal});
    }
}

} // namespace dufs_mcp
