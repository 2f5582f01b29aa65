#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace Lexigraph {

/**
 * @brief UTF-8 to UTF-32 conversion. Invalid start bytes are dropped.
 */
inline std::u32string utf8_to_utf32(const std::string& s) {
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

inline std::string utf32_to_utf8(const std::u32string& s) {
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

namespace detail {

// Upper/lower pairs laid out as alternating code points
inline bool is_upper_in_pair_run(char32_t cp, char32_t first, char32_t last, bool upper_even) {
    return cp >= first && cp <= last && ((cp % 2 == 0) == upper_even);
}

} // namespace detail

/**
 * @brief Simple (one-to-one) lowercase mapping.
 *
 * Covers ASCII, Latin-1, Latin Extended-A, the regular pair runs of Latin
 * Extended-B and Latin Extended Additional, Greek, Cyrillic (with the
 * Supplement), Armenian, Georgian, fullwidth Latin and Deseret. Other
 * scripts (Cherokee, Glagolitic, Coptic, ...), the irregular Latin
 * Extended-B letters and Greek symbol forms map to themselves, so keys
 * lowercased with full Unicode tables may not match for those.
 */
inline char32_t to_lower_codepoint(char32_t cp) {
    using detail::is_upper_in_pair_run;

    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    if (cp < 0x80) return cp;
    if ((cp >= 0xC0 && cp <= 0xDE) && cp != 0xD7) return cp + 0x20;

    // Latin Extended-A
    if (cp >= 0x100 && cp <= 0x17F) {
        if (cp == 0x130) return U'i';
        if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
            return (cp & 1) ? cp + 1 : cp; // Odd code points are uppercase here
        }
        if (cp == 0x178) return 0xFF;
        if (cp == 0x138 || cp == 0x149 || cp == 0x17F) return cp;
        return (cp & 1) ? cp : cp + 1;
    }

    // Latin Extended-B
    if (cp == 0x1C4 || cp == 0x1C5) return 0x1C6;
    if (cp == 0x1C7 || cp == 0x1C8) return 0x1C9;
    if (cp == 0x1CA || cp == 0x1CB) return 0x1CC;
    if (cp == 0x1F1 || cp == 0x1F2) return 0x1F3;
    if (cp == 0x1F4) return 0x1F5;
    if (is_upper_in_pair_run(cp, 0x1CD, 0x1DC, false)) return cp + 1;
    if (is_upper_in_pair_run(cp, 0x1DE, 0x1EF, true) ||
        is_upper_in_pair_run(cp, 0x1F8, 0x21F, true) ||
        is_upper_in_pair_run(cp, 0x222, 0x233, true) ||
        is_upper_in_pair_run(cp, 0x246, 0x24F, true)) {
        return cp + 1;
    }

    // Greek
    if (cp == 0x386) return 0x3AC;
    if (cp >= 0x388 && cp <= 0x38A) return cp + 0x25;
    if (cp == 0x38C) return 0x3CC;
    if (cp == 0x38E || cp == 0x38F) return cp + 0x3F;
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 0x20;
    if (is_upper_in_pair_run(cp, 0x370, 0x373, true) || cp == 0x376 ||
        is_upper_in_pair_run(cp, 0x3D8, 0x3EF, true)) {
        return cp + 1;
    }

    // Cyrillic
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    if (cp == 0x4C0) return 0x4CF;
    if (is_upper_in_pair_run(cp, 0x460, 0x481, true) ||
        is_upper_in_pair_run(cp, 0x48A, 0x4BF, true) ||
        is_upper_in_pair_run(cp, 0x4D0, 0x52F, true)) {
        return cp + 1;
    }
    if (is_upper_in_pair_run(cp, 0x4C1, 0x4CE, false)) return cp + 1;

    // Armenian
    if (cp >= 0x531 && cp <= 0x556) return cp + 0x30;

    // Georgian Asomtavruli -> Nuskhuri, Mtavruli -> Mkhedruli
    if ((cp >= 0x10A0 && cp <= 0x10C5) || cp == 0x10C7 || cp == 0x10CD) return cp + 0x1C60;
    if ((cp >= 0x1C90 && cp <= 0x1CBA) || (cp >= 0x1CBD && cp <= 0x1CBF)) return cp - 0xBC0;

    // Latin Extended Additional
    if (cp == 0x1E9E) return 0xDF;
    if (is_upper_in_pair_run(cp, 0x1E00, 0x1E95, true) ||
        is_upper_in_pair_run(cp, 0x1EA0, 0x1EFF, true)) {
        return cp + 1;
    }

    // Fullwidth Latin, Deseret
    if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;
    if (cp >= 0x10400 && cp <= 0x10427) return cp + 0x28;

    return cp;
}

/**
 * @brief Normalized lookup key of a word: lowercased UTF-8.
 *
 * U+0130 (capital I with dot) lowers to "i" + U+0307, matching full
 * Unicode lowercasing.
 */
inline std::string normalize_word(const std::string& text) {
    std::u32string cps = utf8_to_utf32(text);
    std::u32string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        out.push_back(to_lower_codepoint(cp));
        if (cp == 0x130) out.push_back(0x307);
    }
    return utf32_to_utf8(out);
}

/**
 * @brief Number of code points in a UTF-8 string.
 */
inline size_t codepoint_length(const std::string& text) {
    return utf8_to_utf32(text).size();
}

} // namespace Lexigraph
