#pragma once

#include <discord_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// ToolSchema: name, description and JSON Schema of a tool's input.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult: content blocks produced by a successful tool execution.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
};

/// Build a single-text-block content array.
nlohmann::json TextContent(const std::string& text);

// A tool handler receives arguments that already passed schema validation.
using ToolHandler =
    std::function<Result<ToolResult, Error>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: the catalog of invocable tools.
//
// Execute() is the validation gate in front of every handler:
//   - unregistered name                 -> UnknownTool
//   - arguments violate the input schema -> InvalidParams
//   - handler throws                     -> DeliveryError ("Tool error: ...")
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Registering an existing name replaces its schema and handler in place.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] Result<ToolResult, Error> Execute(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    [[nodiscard]] const ToolSchema* FindSchema(const std::string& name) const;

    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace discord_mcp
