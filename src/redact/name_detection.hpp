#ifndef PIIGUARD_REDACT_NAME_DETECTION_HPP
#define PIIGUARD_REDACT_NAME_DETECTION_HPP

#include <string>
#include <vector>
#include <cstddef>
#include "redact/redaction_types.hpp"
#include "redact/placeholder.hpp"
#include "redact/redaction_stages.hpp"
#include "util/utf8.hpp"

/**
 * @file name_detection.hpp
 * @brief The two name sub-passes that run last.
 *
 * DESIGN GOALS:
 *   - Exact match: when the caller declared a display name, every whole-word,
 *     case-sensitive occurrence becomes [NAME_1], [NAME_2], ...
 *   - Name line: the first non-empty line of a résumé is usually the
 *     candidate's name. If it is 2-4 capitalised tokens and carries no
 *     organisational marker, the whole line becomes [NAME_1]. This
 *     sub-pass numbers independently of the exact-match pass.
 *   - Nothing else is attempted. Unlabelled names in body text stay; this
 *     is a shape test, not entity recognition.
 */

namespace piiguard {
namespace redact {

namespace detail {

/// ASCII word character, matching the \b semantics of the stage patterns.
inline bool isWordByte(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

/**
 * @brief True if a \b word boundary sits between @p text[pos-1] and @p text[pos].
 */
inline bool isWordBoundary(const std::string &text, size_t pos)
{
    const bool before = pos > 0 && isWordByte(text[pos - 1]);
    const bool after = pos < text.size() && isWordByte(text[pos]);
    return before != after;
}

inline const std::vector<std::string>& organisationMarkers()
{
    // compared against a case-folded line
    static const std::vector<std::string> markers = {
        "gmbh", "ag", "ug", "inc.", "llc", "university", "universit\xC3\xA4t", "hochschule"
    };
    return markers;
}

} // namespace detail

/**
 * @brief Replace every whole-word occurrence of the trimmed display name.
 *        An empty (or all-whitespace) name leaves the pass untouched.
 *
 * The name is matched literally, so characters such as '.', '(' or '+'
 * carry no special meaning.
 */
inline void applyDisplayNameStage(RedactionPass &pass, const std::string &displayName)
{
    const std::string name = util::utf8::trim(displayName);
    if (name.empty()) {
        return;
    }

    const std::string &source = pass.text;
    std::string out;
    size_t last = 0;
    size_t searchFrom = 0;
    bool replaced = false;

    while (searchFrom <= source.size()) {
        const size_t hit = source.find(name, searchFrom);
        if (hit == std::string::npos) {
            break;
        }
        const size_t end = hit + name.size();
        if (!detail::isWordBoundary(source, hit) || !detail::isWordBoundary(source, end)) {
            searchFrom = hit + 1;
            continue;
        }

        const std::string replacement = placeholderToken(RedactionCategory::Name,
                                                         pass.counters.next(RedactionCategory::Name));
        out.append(source, last, hit - last);
        out += replacement;
        pass.redactions.emplace_back(RedactionCategory::Name, name, hit, replacement);
        last = end;
        searchFrom = end;
        replaced = true;
    }

    if (!replaced) {
        return;
    }
    out.append(source, last, std::string::npos);
    pass.text.swap(out);
}

/**
 * @brief Shape test for a name line: 2-4 whitespace-separated tokens, each an
 *        uppercase letter followed by one or more letters, apostrophes or
 *        hyphens, and no organisational marker ("GmbH", "AG", "UG", "Inc.",
 *        "LLC", "University", "Universität", "Hochschule") anywhere in the
 *        line, case-insensitively.
 * @param line an already trimmed line
 */
inline bool looksLikeNameLine(const std::string &line)
{
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && util::utf8::isAsciiSpace(line[pos])) {
            ++pos;
        }
        const size_t start = pos;
        while (pos < line.size() && !util::utf8::isAsciiSpace(line[pos])) {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(line.substr(start, pos - start));
        }
    }

    if (tokens.size() < 2 || tokens.size() > 4) {
        return false;
    }

    for (const auto &token : tokens) {
        const std::u32string cps = util::utf8::toUtf32(token);
        if (cps.size() < 2 || !util::utf8::isUpper(cps[0])) {
            return false;
        }
        for (size_t i = 1; i < cps.size(); ++i) {
            const char32_t cp = cps[i];
            if (!util::utf8::isLetter(cp) && cp != U'\'' && cp != U'-') {
                return false;
            }
        }
    }

    const std::string folded = util::utf8::foldCase(line);
    for (const auto &marker : detail::organisationMarkers()) {
        if (folded.find(marker) != std::string::npos) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Inspect the first non-empty line and replace it with [NAME_1] if it
 *        looks like a personal name.
 *
 * Lines are split on "\n" or "\r\n". When the line is replaced, the text is
 * re-joined with "\n". The audit record carries the trimmed line and the
 * byte offset where it starts.
 */
inline void applyNameLineStage(RedactionPass &pass)
{
    const std::string &source = pass.text;

    std::vector<std::string> lines;
    std::vector<size_t> lineStarts;
    size_t start = 0;
    while (true) {
        const size_t nl = source.find('\n', start);
        std::string line = source.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (nl != std::string::npos && !line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        lineStarts.push_back(start);
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string trimmed = util::utf8::trim(lines[i]);
        if (trimmed.empty()) {
            continue;
        }
        if (!looksLikeNameLine(trimmed)) {
            return;
        }

        const size_t offset = lineStarts[i] + lines[i].find(trimmed);
        const std::string replacement = placeholderToken(RedactionCategory::Name, 1);
        lines[i] = replacement;

        std::string joined;
        joined.reserve(source.size());
        for (size_t j = 0; j < lines.size(); ++j) {
            if (j > 0) {
                joined += '\n';
            }
            joined += lines[j];
        }
        pass.redactions.emplace_back(RedactionCategory::Name, trimmed, offset, replacement);
        pass.text.swap(joined);
        return;
    }
}

} // namespace redact
} // namespace piiguard

#endif // PIIGUARD_REDACT_NAME_DETECTION_HPP
