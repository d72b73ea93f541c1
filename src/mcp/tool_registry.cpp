#include <discord_mcp/mcp/tool_registry.hpp>

#include <discord_mcp/core/log.hpp>
#include <discord_mcp/mcp/json_schema.hpp>

#include <exception>

namespace discord_mcp {

nlohmann::json TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (HasTool(name)) {
        LogWarn("registry", "Replacing tool " + name);
        for (auto& schema : schemas_) {
            if (schema.name == name) schema = {name, description, input_schema};
        }
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolSchema* ToolRegistry::FindSchema(const std::string& name) const {
    for (const auto& schema : schemas_) {
        if (schema.name == name) return &schema;
    }
    return nullptr;
}

Result<ToolResult, Error> ToolRegistry::Execute(
    const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    const auto* schema = FindSchema(name);
    if (it == handlers_.end() || schema == nullptr) {
        return Result<ToolResult, Error>::Err(Error{
            "CallTool", "", std::nullopt, "Unknown tool: " + name, std::nullopt,
            ErrorCategory::UnknownTool});
    }

    auto valid = ValidateArguments(schema->input_schema, arguments);
    if (valid.IsErr()) {
        auto error = std::move(valid).Error();
        error.operation = "CallTool";
        error.endpoint = name;
        return Result<ToolResult, Error>::Err(std::move(error));
    }

    LogDebug("registry", "Executing tool " + name);
    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        return Result<ToolResult, Error>::Err(Error{
            "CallTool", name, std::nullopt,
            std::string("Tool error: ") + e.what(), std::nullopt,
            ErrorCategory::DeliveryError});
    }
}

} // namespace discord_mcp
