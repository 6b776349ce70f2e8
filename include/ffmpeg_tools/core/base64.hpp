#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ffmpeg_tools {

// Standard base64 (RFC 4648 alphabet, '=' padding). Bytes are carried in
// std::string; no character set is implied.
std::string Base64Encode(std::string_view bytes);

// Inverse of Base64Encode. The server only encodes; this exists so image
// payloads can be checked byte for byte against the captured output.
// Returns nullopt when the input is not valid padded base64. ASCII
// whitespace is ignored.
std::optional<std::string> Base64Decode(std::string_view text);

} // namespace ffmpeg_tools
