#include <ffmpeg_tools/mcp/tool_registry.hpp>

#include <ffmpeg_tools/core/log.hpp>

#include <algorithm>

namespace ffmpeg_tools {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto it = std::find_if(schemas_.begin(), schemas_.end(),
                           [&](const ToolSchema& s) { return s.name == name; });
    if (it != schemas_.end()) {
        LogWarn("registry", "tool '" + name + "' registered twice; replacing");
        it->description = description;
        it->input_schema = input_schema;
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolHandler* ToolRegistry::FindHandler(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

const ToolSchema* ToolRegistry::FindSchema(const std::string& name) const {
    for (const auto& schema : schemas_) {
        if (schema.name == name) return &schema;
    }
    return nullptr;
}

} // namespace ffmpeg_tools
