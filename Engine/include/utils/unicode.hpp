#pragma once

#include <string>
#include <string_view>
#include <cstdint>

namespace Broadsheet {

/**
 * @brief UTF-8 to UTF-32 conversion. Invalid start bytes are skipped.
 */
inline std::u32string utf8_to_utf32(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
        else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
        else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
        else { ++i; continue; } // Invalid start byte

        for (size_t j = 1; j < len; ++j) {
            if (i + j >= s.size()) { len = j; break; } // Truncated sequence
            uint8_t cc = static_cast<uint8_t>(s[i + j]);
            if ((cc >> 6) != 0x2) { len = j; break; } // Unexpected byte
            cp = (cp << 6) | (cc & 0x3F);
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

inline std::string utf32_to_utf8(std::u32string_view s) {
    std::string out;
    out.reserve(s.size() * 3 / 2);
    for (char32_t cp : s) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

/**
 * @brief Simple lowercase mapping for the scripts found in the newspaper corpus.
 *
 * Covers ASCII, Latin-1 Supplement, Latin Extended-A, Greek and Cyrillic capitals.
 * Everything else maps to itself.
 */
inline char32_t fold_case(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    if (cp < 0xC0) return cp;
    if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 0x20; // 0xD7 is the multiplication sign
    if (cp >= 0x100 && cp <= 0x17F) {
        // Latin Extended-A alternates upper/lower, with the parity flipping in 0x139..0x148 and 0x179..0x17E
        if (cp == 0x130) return U'i';
        if (cp == 0x178) return 0xFF;
        if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
            return (cp & 1) ? cp + 1 : cp;
        }
        if (cp == 0x138 || cp == 0x149 || cp == 0x17F) return cp;
        return (cp & 1) ? cp : cp + 1;
    }
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 0x20;  // Greek
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;                  // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    return cp;
}

inline std::u32string to_lower(std::u32string_view s) {
    std::u32string out(s);
    for (auto& cp : out) cp = fold_case(cp);
    return out;
}

inline std::string to_lower_utf8(std::string_view s) {
    return utf32_to_utf8(to_lower(utf8_to_utf32(s)));
}

/**
 * @brief Number of codepoints in a UTF-8 string.
 */
inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<uint8_t>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace Broadsheet
