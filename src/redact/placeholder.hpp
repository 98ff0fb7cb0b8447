#ifndef PIIGUARD_REDACT_PLACEHOLDER_HPP
#define PIIGUARD_REDACT_PLACEHOLDER_HPP

#include <string>
#include <re2/re2.h>
#include <cstddef>
#include "redact/redaction_types.hpp"

/**
 * @file placeholder.hpp
 * @brief The placeholder wire format: "[" LABEL "_" N "]".
 *
 * The same vocabulary is quoted to the LLM in its privacy instructions, so
 * labels are part of the external contract and must not change:
 *   EMAIL, PHONE, ADDRESS, POSTAL_CODE, DOB, DATE, URL, ID, NAME
 *
 * Tokens are inert for every stage pattern: a label is uppercase letters and
 * underscores, and the counter is glued to an underscore, so no word
 * boundary ever precedes its digits.
 */

namespace piiguard {
namespace redact {

inline const char* placeholderLabel(RedactionCategory category)
{
    switch (category) {
    case RedactionCategory::Email:       return "EMAIL";
    case RedactionCategory::Phone:       return "PHONE";
    case RedactionCategory::Address:     return "ADDRESS";
    case RedactionCategory::PostalCode:  return "POSTAL_CODE";
    case RedactionCategory::DateOfBirth: return "DOB";
    case RedactionCategory::Date:        return "DATE";
    case RedactionCategory::Url:         return "URL";
    case RedactionCategory::Id:          return "ID";
    case RedactionCategory::Name:        return "NAME";
    }
    return "UNKNOWN";
}

/**
 * @brief Map a label back to its category.
 * @return false if @p label is not one of the nine labels.
 */
inline bool categoryFromLabel(const std::string &label, RedactionCategory &out)
{
    for (RedactionCategory c : allCategories()) {
        if (label == placeholderLabel(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

/**
 * @brief Build the token for the n-th (1-based) occurrence, e.g. "[EMAIL_2]".
 */
inline std::string placeholderToken(RedactionCategory category, size_t n)
{
    return std::string("[") + placeholderLabel(category) + "_" + std::to_string(n) + "]";
}

namespace detail {

inline const RE2& placeholderPattern()
{
    static const RE2 pattern(
        R"(\[(EMAIL|PHONE|ADDRESS|POSTAL_CODE|DOB|DATE|URL|ID|NAME)_([1-9][0-9]*)\])");
    return pattern;
}

} // namespace detail

/**
 * @brief True if @p text is exactly one well-formed token.
 */
inline bool isPlaceholder(const std::string &text)
{
    return RE2::FullMatch(text, detail::placeholderPattern());
}

/**
 * @brief Count well-formed tokens of @p category occurring anywhere in @p text.
 */
inline size_t countPlaceholders(const std::string &text, RedactionCategory category)
{
    const std::string wanted = placeholderLabel(category);
    re2::StringPiece input(text);
    re2::StringPiece label;
    size_t n = 0;
    while (RE2::FindAndConsume(&input, detail::placeholderPattern(), &label)) {
        if (label == wanted) {
            ++n;
        }
    }
    return n;
}

} // namespace redact
} // namespace piiguard

#endif // PIIGUARD_REDACT_PLACEHOLDER_HPP
