#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace ffmpeg_tools {

// ---------------------------------------------------------------------------
// ToolOutput: what a handler produces on success. Each handler picks the
// alternative explicitly; the encoder maps every alternative onto MCP
// content blocks.
// ---------------------------------------------------------------------------
struct TextContent {
    std::string text;
};

// A JSON object or array, e.g. a process result or a directory listing.
struct StructuredContent {
    nlohmann::json value;
};

// Raw image bytes plus a format tag such as "png".
struct ImageContent {
    std::string data;
    std::string format;
};

using ToolOutput = std::variant<TextContent, StructuredContent, ImageContent>;

// ---------------------------------------------------------------------------
// ToolError: a failed tool call. A non-zero process exit is not a
// ToolError; it is reported as normal structured output.
// ---------------------------------------------------------------------------
enum class ToolErrorKind {
    UnknownTool,
    InvalidArguments,
    HandlerFailed,
};

const char* ToolErrorKindName(ToolErrorKind kind);

struct ToolError {
    ToolErrorKind kind = ToolErrorKind::HandlerFailed;
    std::string message;
    std::string tool;  // filled in by the dispatcher

    static ToolError InvalidArguments(std::string message) {
        return ToolError{ToolErrorKind::InvalidArguments, std::move(message), {}};
    }

    static ToolError HandlerFailed(std::string message) {
        return ToolError{ToolErrorKind::HandlerFailed, std::move(message), {}};
    }
};

// ---------------------------------------------------------------------------
// ToolResult: encoded outcome of a tools/call, ready for the wire.
// `content` is an array of MCP content blocks.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    std::optional<ToolErrorKind> error_kind;
    nlohmann::json content = nlohmann::json::array();
};

} // namespace ffmpeg_tools
