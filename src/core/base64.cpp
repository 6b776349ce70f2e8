#include <ffmpeg_tools/core/base64.hpp>

#include <array>
#include <cstdint>

namespace ffmpeg_tools {

namespace {

constexpr const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint8_t kInvalid = 0xFF;

std::array<uint8_t, 256> MakeDecodeTable() {
    std::array<uint8_t, 256> table{};
    table.fill(kInvalid);
    for (uint8_t i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = i;
    }
    return table;
}

bool IsSpace(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // anonymous namespace

std::string Base64Encode(std::string_view bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    const size_t len = bytes.size();
    const auto byte_at = [&bytes, len](size_t i) -> uint32_t {
        return i < len ? static_cast<uint8_t>(bytes[i]) : 0;
    };
    for (size_t i = 0; i < len; i += 3) {
        const uint32_t b0 = byte_at(i);
        const uint32_t b1 = byte_at(i + 1);
        const uint32_t b2 = byte_at(i + 2);
        const uint32_t triple = (b0 << 16) | (b1 << 8) | b2;

        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back((i + 1 < len) ? kAlphabet[(triple >> 6) & 0x3F] : '=');
        out.push_back((i + 2 < len) ? kAlphabet[triple & 0x3F] : '=');
    }
    return out;
}

std::optional<std::string> Base64Decode(std::string_view text) {
    static const auto table = MakeDecodeTable();

    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!IsSpace(c)) compact.push_back(c);
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string out;
    out.reserve((compact.size() / 4) * 3);

    for (size_t i = 0; i < compact.size(); i += 4) {
        const bool last = (i + 4 == compact.size());
        size_t pad = 0;
        uint32_t quad = 0;
        for (size_t j = 0; j < 4; ++j) {
            const char c = compact[i + j];
            if (c == '=') {
                // Padding only in the last quad, only in the final 1-2 slots.
                if (!last || j < 2) return std::nullopt;
                ++pad;
                quad <<= 6;
                continue;
            }
            if (pad > 0) return std::nullopt;
            const uint8_t v = table[static_cast<uint8_t>(c)];
            if (v == kInvalid) return std::nullopt;
            quad = (quad << 6) | v;
        }

        out.push_back(static_cast<char>((quad >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<char>((quad >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<char>(quad & 0xFF));
    }
    return out;
}

} // namespace ffmpeg_tools
