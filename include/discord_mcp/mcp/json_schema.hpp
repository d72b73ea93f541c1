#pragma once

#include <discord_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// ValidateArguments: check tool arguments against a tool's input schema.
//
// Supports the subset of JSON Schema that tool schemas here use:
//   - root "type": "object"
//   - "required": [names]
//   - "properties": {name: {"type": ..., "enum": [...]}}
//   - "additionalProperties": false
//
// Every violation is an InvalidParams error naming the offending parameter.
// ---------------------------------------------------------------------------
Result<void, Error> ValidateArguments(const nlohmann::json& schema,
                                      const nlohmann::json& arguments);

} // namespace discord_mcp
