#pragma once

#include <dufs_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// ToolSchema: JSON Schema for a tool's input parameters.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// A tool handler takes the `arguments` object of tools/call and returns the
// payload to report, or the error that stopped it.
using ToolHandler =
    std::function<Result<nlohmann::json, Error>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools.
//
// Filled once at startup, then handed by value to McpServer, which only
// calls the const members. Tools() keeps registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        const std::string& name,
        const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace dufs_mcp
