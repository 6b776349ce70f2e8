#pragma once

#include <ffmpeg_tools/mcp/tool_result.hpp>

#include <string>

namespace ffmpeg_tools {

// Map a handler's output onto MCP content blocks:
//   TextContent       -> {"type":"text","text":<verbatim>}
//   StructuredContent -> {"type":"text","text":<JSON, keys sorted>}
//   ImageContent      -> {"type":"image","data":<base64>,"mimeType":"image/<format>"}
[[nodiscard]] ToolResult EncodeOutput(const ToolOutput& output);

// Single text block holding {"error":{"kind","tool","message"}}, isError set.
[[nodiscard]] ToolResult EncodeError(const ToolError& error);

// "png" -> "image/png". The tag is used unchanged.
[[nodiscard]] std::string ImageMimeType(const std::string& format);

// Serialise JSON for the wire; invalid UTF-8 is replaced, never thrown.
[[nodiscard]] std::string DumpJson(const nlohmann::json& value);

} // namespace ffmpeg_tools
