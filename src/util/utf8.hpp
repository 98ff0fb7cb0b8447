#ifndef PIIGUARD_UTIL_UTF8_HPP
#define PIIGUARD_UTIL_UTF8_HPP

#include <string>
#include <cstdint>

/**
 * @file utf8.hpp
 * @brief Minimal UTF-8 decoding and letter classification.
 *
 * The name heuristics scan bytes by hand, so the checks that must be
 * Unicode-aware (uppercase initials such as "Ä", letters such as "ß")
 * decode code points here. Classification covers Latin (Basic, Latin-1 Supplement,
 * Extended-A/B), Greek and Cyrillic, which is what names in DACH and
 * European résumés use. Invalid sequences decode to U+FFFD and are not
 * letters.
 */

namespace piiguard {
namespace util {
namespace utf8 {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

/**
 * @brief Decode the code point starting at byte offset @p pos and advance
 *        @p pos past it. Never reads beyond s.size().
 */
inline char32_t decodeNext(const std::string &s, size_t &pos)
{
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t extra = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        ++pos;
        return REPLACEMENT_CHAR;
    }

    // truncated sequence at end of input
    if (pos + extra >= s.size()) {
        pos = s.size();
        return REPLACEMENT_CHAR;
    }
    for (size_t i = 1; i <= extra; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if ((c & 0xC0) != 0x80) {
            pos += i;
            return REPLACEMENT_CHAR;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    pos += extra + 1;
    return cp;
}

/**
 * @brief Decode a whole UTF-8 string to UTF-32.
 */
inline std::u32string toUtf32(const std::string &s)
{
    std::u32string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        out.push_back(decodeNext(s, pos));
    }
    return out;
}

/**
 * @brief Uppercase letter test for the supported scripts.
 */
inline bool isUpper(char32_t cp)
{
    if (cp >= U'A' && cp <= U'Z') return true;
    // Latin-1: À..Þ except ×
    if (cp >= 0xC0 && cp <= 0xDE) return cp != 0xD7;
    // Latin Extended-A: uppercase on even code points, with the
    // 0x139..0x148 and 0x179..0x17E blocks shifted by one.
    if (cp >= 0x100 && cp <= 0x17F) {
        if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
            return (cp % 2) == 1;
        }
        if (cp == 0x138 || cp == 0x149 || cp == 0x17F) return false;
        return (cp % 2) == 0;
    }
    // Latin Extended-B: the even-paired range used by Romanian and Croatian.
    if (cp >= 0x218 && cp <= 0x21B) return (cp % 2) == 0;
    // Greek capitals
    if (cp >= 0x391 && cp <= 0x3A9) return cp != 0x3A2;
    // Cyrillic capitals
    if (cp >= 0x400 && cp <= 0x42F) return true;
    return false;
}

/**
 * @brief Letter test (any case) for the supported scripts.
 */
inline bool isLetter(char32_t cp)
{
    if ((cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z')) return true;
    if (cp == 0xAA || cp == 0xB5 || cp == 0xBA) return true;
    // Latin-1 letters, excluding × and ÷
    if (cp >= 0xC0 && cp <= 0xFF) return cp != 0xD7 && cp != 0xF7;
    // Latin Extended-A and B
    if (cp >= 0x100 && cp <= 0x24F) return true;
    // Greek
    if (cp >= 0x386 && cp <= 0x3FF) return cp != 0x387 && cp != 0x38B && cp != 0x38D && cp != 0x3A2;
    // Cyrillic
    if (cp >= 0x400 && cp <= 0x481) return true;
    if (cp >= 0x48A && cp <= 0x52F) return true;
    // Latin Extended Additional (Vietnamese, Welsh)
    if (cp >= 0x1E00 && cp <= 0x1EFF) return true;
    return false;
}

inline bool isAsciiSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * @brief Strip leading and trailing ASCII whitespace.
 */
inline std::string trim(const std::string &s)
{
    size_t begin = 0;
    while (begin < s.size() && isAsciiSpace(s[begin])) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && isAsciiSpace(s[end - 1])) {
        --end;
    }
    return s.substr(begin, end - begin);
}

/**
 * @brief Case-fold for substring checks: ASCII letters and the Latin-1
 *        capitals (À..Þ, so "Ä" -> "ä") are lowered, everything else is
 *        copied unchanged.
 */
inline std::string foldCase(const std::string &s)
{
    std::string out(s);
    for (size_t i = 0; i < out.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(out[i]);
        if (c >= 'A' && c <= 'Z') {
            out[i] = static_cast<char>(c - 'A' + 'a');
        } else if (c == 0xC3 && i + 1 < out.size()) {
            const unsigned char next = static_cast<unsigned char>(out[i + 1]);
            // U+00C0..U+00DE, minus the multiplication sign U+00D7
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                out[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
        }
    }
    return out;
}

} // namespace utf8
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_UTF8_HPP
