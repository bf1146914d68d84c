#include "util/utf8.hpp"
#include <cstdint>

namespace mfnf {

bool is_valid_utf8(const std::string& bytes) {
    const size_t len = bytes.size();
    size_t i = 0;

    while (i < len) {
        uint8_t lead = static_cast<uint8_t>(bytes[i]);

        if (lead < 0x80) {
            i++;
            continue;
        }

        size_t follow;
        uint8_t lo = 0x80;  // bounds for the first continuation byte
        uint8_t hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            follow = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            follow = 2;
            if (lead == 0xE0) lo = 0xA0;       // overlong
            else if (lead == 0xED) hi = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            follow = 3;
            if (lead == 0xF0) lo = 0x90;       // overlong
            else if (lead == 0xF4) hi = 0x8F;  // > U+10FFFF
        } else {
            return false;
        }

        if (i + follow >= len) {
            return false;
        }

        for (size_t k = 1; k <= follow; ++k) {
            uint8_t c = static_cast<uint8_t>(bytes[i + k]);
            if (k == 1) {
                if (c < lo || c > hi) return false;
            } else if (c < 0x80 || c > 0xBF) {
                return false;
            }
        }

        i += follow + 1;
    }

    return true;
}

namespace {

// Decodes the sequence starting at pos. Returns its length in bytes, or 0
// if the bytes there are not a well-formed sequence.
size_t decode_at(const std::string& bytes, size_t pos, char32_t& cp) {
    uint8_t lead = static_cast<uint8_t>(bytes[pos]);
    size_t len;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
        cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        cp = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + len > bytes.size() || !is_valid_utf8(bytes.substr(pos, len))) {
        return 0;
    }
    for (size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<uint8_t>(bytes[pos + k]) & 0x3F);
    }
    return len;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_white_space(char32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

char32_t lower_code_point(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;

    // Latin Extended-A pairs capital/small, with two shifts in parity
    if (cp >= 0x0100 && cp <= 0x0137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x0139 && cp <= 0x0148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x014A && cp <= 0x0177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x0178) return 0xFF;
    if (cp >= 0x0179 && cp <= 0x017E) return (cp % 2 == 1) ? cp + 1 : cp;

    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    if (cp == 0x1E9E) return 0xDF;
    return cp;
}

} // namespace

std::string trim_unicode_whitespace(const std::string& text) {
    size_t first = std::string::npos;
    size_t last_end = 0;

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t len = decode_at(text, pos, cp);
        bool space = len > 0 && is_white_space(cp);
        if (len == 0) {
            len = 1;
        }
        if (!space) {
            if (first == std::string::npos) {
                first = pos;
            }
            last_end = pos + len;
        }
        pos += len;
    }

    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first, last_end - first);
}

std::string to_lower_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t len = decode_at(text, pos, cp);
        if (len == 0) {
            out += text[pos];
            pos++;
            continue;
        }
        append_utf8(out, lower_code_point(cp));
        pos += len;
    }

    return out;
}

} // namespace mfnf
