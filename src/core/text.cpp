#include <ffmpeg_tools/core/text.hpp>

#include <cstdint>

namespace ffmpeg_tools {

namespace {

constexpr const char kReplacement[] = "\xEF\xBF\xBD";

// Length of the sequence introduced by `lead`, or 0 if it cannot start one.
size_t SequenceLength(uint8_t lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Valid range for the second byte depends on the lead byte (rules out
// overlongs, surrogates and code points above U+10FFFF).
bool SecondByteOk(uint8_t lead, uint8_t b) {
    switch (lead) {
        case 0xE0: return b >= 0xA0 && b <= 0xBF;
        case 0xED: return b >= 0x80 && b <= 0x9F;
        case 0xF0: return b >= 0x90 && b <= 0xBF;
        case 0xF4: return b >= 0x80 && b <= 0x8F;
        default:   return b >= 0x80 && b <= 0xBF;
    }
}

} // anonymous namespace

std::string SanitizeUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<uint8_t>(bytes[i]);
        const size_t len = SequenceLength(lead);
        if (len == 1) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }
        if (len == 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        // Consume the longest valid prefix; an incomplete one becomes a
        // single replacement character.
        size_t valid = 1;
        while (valid < len && i + valid < bytes.size()) {
            const auto b = static_cast<uint8_t>(bytes[i + valid]);
            const bool ok = (valid == 1) ? SecondByteOk(lead, b)
                                         : (b >= 0x80 && b <= 0xBF);
            if (!ok) break;
            ++valid;
        }

        if (valid == len) {
            out.append(bytes.substr(i, len));
        } else {
            out += kReplacement;
        }
        i += valid;
    }
    return out;
}

} // namespace ffmpeg_tools
