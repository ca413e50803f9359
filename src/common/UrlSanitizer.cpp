#include "../../include/media_grab/common/UrlSanitizer.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace media_grab::common {

static inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static inline bool isInvisibleCodepoint(uint32_t cp) {
    return (cp >= 0x200B && cp <= 0x200F) ||
           (cp >= 0x202A && cp <= 0x202E) ||
           cp == 0x2060 ||
           (cp >= 0x2066 && cp <= 0x2069) ||
           cp == 0xFEFF;
}

// Decode one UTF-8 sequence starting at s[i]. Returns the byte length, or 0 for
// an invalid lead byte or truncated sequence.
static size_t decodeUtf8(const std::string& s, size_t i, uint32_t& cp) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if ((c & 0xE0) == 0xC0 && i + 1 < s.size()) {
        cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F);
        return 2;
    }
    if ((c & 0xF0) == 0xE0 && i + 2 < s.size()) {
        cp = ((c & 0x0F) << 12) |
             ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 6) |
             (static_cast<unsigned char>(s[i + 2]) & 0x3F);
        return 3;
    }
    if ((c & 0xF8) == 0xF0 && i + 3 < s.size()) {
        cp = ((c & 0x07) << 18) |
             ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 12) |
             ((static_cast<unsigned char>(s[i + 2]) & 0x3F) << 6) |
             (static_cast<unsigned char>(s[i + 3]) & 0x3F);
        return 4;
    }
    return 0;
}

static std::string filterCodepoints(const std::string& s, bool keepWhitespace) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0x80) == 0) {
            bool control = c < 0x20 || c == 0x7F;
            if (control && !(keepWhitespace && isAsciiSpace(c))) {
                i++;
                continue;
            }
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        uint32_t cp = 0;
        size_t adv = decodeUtf8(s, i, cp);
        if (adv == 0) {
            i++;
            continue;
        }
        if (!isInvisibleCodepoint(cp)) {
            out.append(s, i, adv);
        }
        i += adv;
    }

    return out;
}

std::string sanitizeUrl(const std::string& input) {
    if (input.empty()) return input;

    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    return filterCodepoints(input.substr(start, end - start), false);
}

std::string stripInvisible(const std::string& text) {
    return filterCodepoints(text, true);
}

std::string stripAnsiEscapes(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\x1b') {
            out.push_back(text[i]);
            continue;
        }
        // CSI: ESC '[' params... final byte in 0x40-0x7E
        if (i + 1 < text.size() && text[i + 1] == '[') {
            size_t j = i + 2;
            while (j < text.size() && !(text[j] >= 0x40 && text[j] <= 0x7E)) j++;
            i = j;
        } else if (i + 1 < text.size()) {
            i++;  // two-byte escape
        }
    }
    return out;
}

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string hexDump(const std::string& input) {
    std::ostringstream oss;
    oss.setf(std::ios::hex, std::ios::basefield);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned int v = static_cast<unsigned char>(input[i]);
        if (i) oss << ' ';
        if (v < 0x10) oss << '0';
        oss << v;
    }
    return oss.str();
}

} // namespace media_grab::common
