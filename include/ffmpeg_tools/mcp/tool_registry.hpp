#pragma once

#include <ffmpeg_tools/core/result.hpp>
#include <ffmpeg_tools/mcp/tool_result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ffmpeg_tools {

// ---------------------------------------------------------------------------
// ToolSchema: name, description and JSON Schema of a tool's arguments.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// A tool handler receives arguments that already passed schema validation.
// Expected failures come back as Err; anything thrown is caught by the
// dispatcher and reported as HandlerFailed.
using ToolHandler =
    std::function<Result<ToolOutput, ToolError>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: tools known to the server, in registration order.
//
// Populated at startup only. Registering a name twice replaces the earlier
// handler, description and schema but keeps its position in Tools().
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

    // nullptr when no tool of that name exists.
    [[nodiscard]] const ToolHandler* FindHandler(const std::string& name) const;
    [[nodiscard]] const ToolSchema* FindSchema(const std::string& name) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace ffmpeg_tools
