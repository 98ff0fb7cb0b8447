#ifndef PIIGUARD_REDACT_REDACTION_STAGES_HPP
#define PIIGUARD_REDACT_REDACTION_STAGES_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <cstddef>
#include <re2/re2.h>
#include "redact/redaction_types.hpp"
#include "redact/placeholder.hpp"

/**
 * @file redaction_stages.hpp
 * @brief The pattern-based category stages (everything except names).
 *
 * DESIGN GOALS:
 *   - Each stage reads pass.text, substitutes its matches with numbered
 *     tokens and appends one audit record per substitution.
 *   - Matching is done against the text as it stands when the stage starts.
 *     Offsets in the audit records refer to that text.
 *   - A match that a stage declines (year ranges, years inside dates) keeps
 *     its text and does not consume a number.
 *   - Patterns are RE2 objects in UTF-8 mode, compiled once. Matching is
 *     linear in the input and never recurses, so text of any length is
 *     safe. \b, \d and \s are ASCII classes.
 *
 * USAGE:
 *   @code
 *   using namespace piiguard::redact;
 *   RedactionPass pass("mail me: jane@example.org");
 *   applyEmailStage(pass);
 *   // pass.text == "mail me: [EMAIL_1]"
 *   @endcode
 */

namespace piiguard {
namespace redact {

/**
 * @struct RedactionPass
 * @brief Accumulator threaded through the stages of one engine invocation.
 */
struct RedactionPass
{
    std::string text;
    std::vector<Redaction> redactions;
    PlaceholderCounters counters;

    explicit RedactionPass(const std::string &input)
        : text(input)
    {
    }
};

namespace detail {

inline RE2::Options caseInsensitive()
{
    RE2::Options options;
    options.set_case_sensitive(false);
    return options;
}

/**
 * @brief Replace every accepted match of @p pattern in pass.text.
 * @param accept  bool(const std::string &text, const std::string &match, size_t offset)
 * @param prefix  literal text written before the token
 */
template <typename AcceptFn>
inline void substitute(RedactionPass &pass,
                       const RE2 &pattern,
                       RedactionCategory category,
                       AcceptFn accept,
                       const std::string &prefix = "")
{
    const std::string &source = pass.text;
    const re2::StringPiece view(source);
    re2::StringPiece m;
    std::string out;
    size_t last = 0;
    size_t next = 0;
    bool replaced = false;

    while (next < source.size()
           && pattern.Match(view, next, source.size(), RE2::UNANCHORED, &m, 1))
    {
        const size_t offset = static_cast<size_t>(m.data() - view.data());
        // a declined or empty match still moves the cursor past it
        next = offset + std::max<size_t>(1, m.size());

        const std::string matched(m.data(), m.size());
        if (!accept(source, matched, offset)) {
            continue;
        }

        const std::string replacement = prefix + placeholderToken(category, pass.counters.next(category));
        if (!replaced) {
            out.reserve(source.size());
        }
        out.append(source, last, offset - last);
        out += replacement;
        last = offset + matched.size();
        replaced = true;
        pass.redactions.emplace_back(category, matched, offset, replacement);
    }

    if (!replaced) {
        return;
    }
    out.append(source, last, std::string::npos);
    pass.text.swap(out);
}

inline bool acceptAll(const std::string &, const std::string &, size_t)
{
    return true;
}

/**
 * @brief Length of the [DATE_n] or [DOB_n] token opening at text[open], 0 if
 *        there is none.
 */
inline size_t dateTokenLength(const std::string &text, size_t open)
{
    const size_t close = text.find(']', open);
    if (close == std::string::npos || close - open > 24) {
        return 0;
    }
    const std::string token = text.substr(open, close - open + 1);
    if (token.compare(0, 6, "[DATE_") != 0 && token.compare(0, 5, "[DOB_") != 0) {
        return 0;
    }
    return isPlaceholder(token) ? token.size() : 0;
}

} // namespace detail

/**
 * @brief The email shape shared with the leakage auditor.
 */
inline const RE2& emailPattern()
{
    static const RE2 pattern(R"(\b[A-Z0-9._%+-]+@[A-Z0-9.-]+\.[A-Z]{2,}\b)",
                             detail::caseInsensitive());
    return pattern;
}

/**
 * @brief True for "2020-2023", "1999 - 2001", "2019–2021": a four-digit year
 *        range, which résumés use for employment periods.
 */
inline bool isYearRange(const std::string &match)
{
    static const RE2 pattern(R"(\s*\d{4}\s?(?:-|–)\s?\d{4}\s*)");
    return RE2::FullMatch(match, pattern);
}

/**
 * @brief True if @p match is a 19xx/20xx year that sits next to a date.
 *
 * A date is either a separator ('.', '-', '/') in the 10 bytes before or
 * after the match, or a [DATE_n] / [DOB_n] token reaching into those bytes.
 * The token rule keeps a second run over redacted output from turning the
 * year into a postal code.
 */
inline bool isYearInDateContext(const std::string &text, const std::string &match, size_t offset)
{
    const bool looksLikeYear = match.size() == 4
        && ((match[0] == '1' && match[1] == '9') || (match[0] == '2' && match[1] == '0'));
    if (!looksLikeYear) {
        return false;
    }

    const size_t windowStart = offset >= 10 ? offset - 10 : 0;
    const std::string before = text.substr(windowStart, offset - windowStart);
    const size_t afterStart = std::min(text.size(), offset + match.size());
    const size_t afterEnd = std::min(text.size(), afterStart + 10);
    const std::string after = text.substr(afterStart, afterEnd - afterStart);
    const std::string context = before + after;
    if (context.find_first_of(".-/") != std::string::npos) {
        return true;
    }

    // a token can start up to its own length before the window
    const size_t scanFrom = windowStart >= 24 ? windowStart - 24 : 0;
    for (size_t q = text.find('[', scanFrom); q != std::string::npos && q < afterEnd;
         q = text.find('[', q + 1))
    {
        const size_t len = detail::dateTokenLength(text, q);
        if (len == 0) {
            continue;
        }
        const size_t end = q + len;
        const bool touchesBefore = q < offset && end > windowStart;
        const bool touchesAfter = end > afterStart;
        if (touchesBefore || touchesAfter) {
            return true;
        }
    }
    return false;
}

// 1) Emails
inline void applyEmailStage(RedactionPass &pass)
{
    detail::substitute(pass, emailPattern(), RedactionCategory::Email, detail::acceptAll);
}

// 2) URLs, up to whitespace or a closing paren/bracket
inline void applyUrlStage(RedactionPass &pass)
{
    static const RE2 pattern(R"(\bhttps?://[^\s)\]]+|\bwww\.[^\s)\]]+)",
                             detail::caseInsensitive());
    detail::substitute(pass, pattern, RedactionCategory::Url, detail::acceptAll);
}

// 3) Phone numbers (broad): optional +CC/00CC, optional (area), digit groups
inline void applyPhoneStage(RedactionPass &pass)
{
    static const RE2 pattern(
        R"((?:(?:\+|00)\s?\d{1,3}[\s\-]?)?(?:\(?\d{2,5}\)?[\s\-]?)\d{3,}(?:[\s\-]?\d{2,})+)");
    detail::substitute(pass, pattern, RedactionCategory::Phone,
        [](const std::string &, const std::string &match, size_t) {
            return !isYearRange(match);
        });
}

// 4) Postal codes: standalone 4-5 digit runs
inline void applyPostalCodeStage(RedactionPass &pass)
{
    static const RE2 pattern(R"(\b\d{4,5}\b)");
    detail::substitute(pass, pattern, RedactionCategory::PostalCode,
        [](const std::string &text, const std::string &match, size_t offset) {
            return !isYearInDateContext(text, match, offset);
        });
}

// 5) Street + house number, e.g. "Musterstraße 12", "Hauptstr. 5a"
inline void applyAddressStage(RedactionPass &pass)
{
    // initial: ASCII letter or umlaut; body: any Unicode letter, '.', '-'
    static const RE2 pattern(
        R"(\b([A-ZÄÖÜ][\p{L}.\-]{2,}\s?)"
        R"((?:straße|str\.|strasse|weg|allee|gasse|ring|platz|damm|ufer)))"
        R"(\s+\d{1,4}\s?[A-Z]?\b)",
        detail::caseInsensitive());
    detail::substitute(pass, pattern, RedactionCategory::Address, detail::acceptAll);
}

// 6) Labelled dates of birth; the label is replaced too, "DOB: " is re-inserted
inline void applyDateOfBirthStage(RedactionPass &pass)
{
    static const RE2 pattern(
        R"((geb\.?|geboren|date of birth|dob)\s*[:\-]?\s*)"
        R"((\d{1,2}[./-]\d{1,2}[./-]\d{2,4}|\d{4}-\d{2}-\d{2}))",
        detail::caseInsensitive());
    detail::substitute(pass, pattern, RedactionCategory::DateOfBirth, detail::acceptAll, "DOB: ");
}

// 7) Any remaining D.M.Y or ISO date
inline void applyDateStage(RedactionPass &pass)
{
    static const RE2 pattern(R"(\b(\d{1,2}[./-]\d{1,2}[./-]\d{2,4}|\d{4}-\d{2}-\d{2})\b)");
    detail::substitute(pass, pattern, RedactionCategory::Date, detail::acceptAll);
}

// 8) IBAN-like tokens, 11-digit tax IDs, NN/NNN/NNN/NNN tax numbers
inline void applyIdStage(RedactionPass &pass)
{
    static const RE2 pattern(
        R"(\b([A-Z]{2}\d{2}[A-Z0-9]{11,30}|\d{11}\b|\d{2}/\d{3}/\d{3}/\d{3})\b)");
    detail::substitute(pass, pattern, RedactionCategory::Id, detail::acceptAll);
}

} // namespace redact
} // namespace piiguard

#endif // PIIGUARD_REDACT_REDACTION_STAGES_HPP
