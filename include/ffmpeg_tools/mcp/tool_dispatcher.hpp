#pragma once

#include <ffmpeg_tools/mcp/tool_registry.hpp>
#include <ffmpeg_tools/mcp/tool_result.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ffmpeg_tools {

// One inbound tools/call, consumed once.
struct ToolCallRequest {
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// ToolDispatcher: the boundary between the session and tool handlers.
//
// Dispatch() looks the tool up, validates arguments against its input
// schema, runs the handler and encodes the outcome. It never throws: unknown
// tools, bad arguments and handler failures all come back as error results.
// The registry is owned and only read after construction.
// ---------------------------------------------------------------------------
class ToolDispatcher {
public:
    explicit ToolDispatcher(ToolRegistry registry);

    [[nodiscard]] ToolResult Dispatch(const ToolCallRequest& request) const;

    [[nodiscard]] const ToolRegistry& Registry() const noexcept {
        return registry_;
    }

private:
    ToolRegistry registry_;
};

// Minimal JSON Schema check used before a handler runs. Supports "required",
// per-property "type" (string, integer, number, boolean, array, object),
// "items.type", "minItems" and "minLength". Returns a message naming the
// offending field, or nullopt when the arguments are acceptable.
[[nodiscard]] std::optional<std::string> ValidateArguments(
    const nlohmann::json& schema, const nlohmann::json& arguments);

} // namespace ffmpeg_tools
