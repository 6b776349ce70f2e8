#include <ffmpeg_tools/mcp/result_encoder.hpp>

#include <ffmpeg_tools/core/base64.hpp>

#include <type_traits>

namespace ffmpeg_tools {

const char* ToolErrorKindName(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::UnknownTool:      return "UnknownTool";
        case ToolErrorKind::InvalidArguments: return "InvalidArguments";
        case ToolErrorKind::HandlerFailed:    return "HandlerFailed";
    }
    return "HandlerFailed";
}

std::string ImageMimeType(const std::string& format) {
    return "image/" + format;
}

std::string DumpJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ToolResult EncodeOutput(const ToolOutput& output) {
    nlohmann::json block = std::visit(
        [](const auto& content) -> nlohmann::json {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, TextContent>) {
                return {{"type", "text"}, {"text", content.text}};
            } else if constexpr (std::is_same_v<T, StructuredContent>) {
                return {{"type", "text"}, {"text", DumpJson(content.value)}};
            } else {
                static_assert(std::is_same_v<T, ImageContent>,
                              "unhandled ToolOutput alternative");
                return {{"type", "image"},
                        {"data", Base64Encode(content.data)},
                        {"mimeType", ImageMimeType(content.format)}};
            }
        },
        output);

    ToolResult result;
    result.content.push_back(std::move(block));
    return result;
}

ToolResult EncodeError(const ToolError& error) {
    nlohmann::json body = {
        {"kind", ToolErrorKindName(error.kind)},
        {"message", error.message},
    };
    if (!error.tool.empty()) {
        body["tool"] = error.tool;
    }

    const nlohmann::json wrapped = {{"error", body}};

    ToolResult result;
    result.is_error = true;
    result.error_kind = error.kind;
    result.content.push_back({{"type", "text"}, {"text", DumpJson(wrapped)}});
    return result;
}

} // namespace ffmpeg_tools
