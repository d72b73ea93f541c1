#include <discord_mcp/mcp/json_schema.hpp>

#include <algorithm>
#include <string>

namespace discord_mcp {

namespace {

Error MakeParamError(const std::string& message) {
    return Error{"ValidateArguments", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidParams};
}

bool IsType(const nlohmann::json& value, const std::string& type) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "number")  return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    return true;  // unknown types are not checked
}

std::string EnumList(const nlohmann::json& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ", ";
        out += v.is_string() ? v.get<std::string>() : v.dump();
    }
    return out;
}

std::string Describe(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

Result<void, Error> ValidateProperty(const std::string& name,
                                     const nlohmann::json& property_schema,
                                     const nlohmann::json& value) {
    if (property_schema.contains("type") && property_schema["type"].is_string()) {
        const auto type = property_schema["type"].get<std::string>();
        if (!IsType(value, type)) {
            return Result<void, Error>::Err(MakeParamError(
                "Parameter '" + name + "' must be of type " + type));
        }
    }
    if (property_schema.contains("enum") && property_schema["enum"].is_array()) {
        const auto& allowed = property_schema["enum"];
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            return Result<void, Error>::Err(MakeParamError(
                "Unsupported value for '" + name + "': " + Describe(value) +
                " (expected one of: " + EnumList(allowed) + ")"));
        }
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<void, Error> ValidateArguments(const nlohmann::json& schema,
                                      const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        return Result<void, Error>::Err(
            MakeParamError("Tool arguments must be a JSON object"));
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& req : schema["required"]) {
            const auto key = req.get<std::string>();
            if (!arguments.contains(key)) {
                return Result<void, Error>::Err(
                    MakeParamError("Missing required parameter: " + key));
            }
        }
    }

    const nlohmann::json empty = nlohmann::json::object();
    const auto& properties =
        (schema.contains("properties") && schema["properties"].is_object())
            ? schema["properties"]
            : empty;
    const bool closed = schema.contains("additionalProperties") &&
                        schema["additionalProperties"] == false;

    for (const auto& [name, value] : arguments.items()) {
        if (!properties.contains(name)) {
            if (closed) {
                return Result<void, Error>::Err(
                    MakeParamError("Unknown parameter: " + name));
            }
            continue;
        }
        auto checked = ValidateProperty(name, properties[name], value);
        if (checked.IsErr()) {
            return checked;
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace discord_mcp
