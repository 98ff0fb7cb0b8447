#ifndef PIIGUARD_REDACT_REDACTION_TYPES_HPP
#define PIIGUARD_REDACT_REDACTION_TYPES_HPP

#include <string>
#include <vector>
#include <array>
#include <cstddef>

/**
 * @file redaction_types.hpp
 * @brief Value types shared by the redaction stages, the engine and its callers.
 *
 * DESIGN GOALS:
 *   - RedactionCategory is a closed set. Its declaration order is NOT the
 *     order in which stages run; see redaction_engine.hpp for that.
 *   - Redaction records are immutable once produced.
 *   - RedactionResult is returned by value and owns everything it refers to.
 */

namespace piiguard {
namespace redact {

/**
 * @enum RedactionCategory
 * @brief Kinds of identifiers the engine recognises.
 */
enum class RedactionCategory {
    Email,
    Phone,
    Address,
    PostalCode,
    DateOfBirth,
    Date,
    Url,
    Id,
    Name
};

/// Number of enumerators in RedactionCategory.
constexpr size_t CATEGORY_COUNT = 9;

/**
 * @brief Every category, in declaration order.
 */
inline const std::array<RedactionCategory, CATEGORY_COUNT>& allCategories()
{
    static const std::array<RedactionCategory, CATEGORY_COUNT> categories = {{
        RedactionCategory::Email,
        RedactionCategory::Phone,
        RedactionCategory::Address,
        RedactionCategory::PostalCode,
        RedactionCategory::DateOfBirth,
        RedactionCategory::Date,
        RedactionCategory::Url,
        RedactionCategory::Id,
        RedactionCategory::Name
    }};
    return categories;
}

/**
 * @brief One replacement performed by a stage.
 *
 * offset is a byte offset into the text as it stood when the stage that
 * produced this record ran, not into the caller's original input.
 */
class Redaction
{
public:
    Redaction(RedactionCategory category,
              const std::string &match,
              size_t offset,
              const std::string &replacement)
        : category_(category), match_(match), offset_(offset), replacement_(replacement)
    {
    }

    RedactionCategory category() const { return category_; }
    const std::string& match() const { return match_; }
    size_t offset() const { return offset_; }
    const std::string& replacement() const { return replacement_; }

private:
    RedactionCategory category_;
    std::string match_;
    size_t offset_;
    std::string replacement_;
};

/**
 * @struct RedactionResult
 * @brief Redacted text plus the audit list, in the order the stages ran.
 */
struct RedactionResult
{
    std::string text;
    std::vector<Redaction> redactions;

    /**
     * @brief Number of audit records of the given category.
     */
    size_t countOf(RedactionCategory category) const
    {
        size_t n = 0;
        for (const auto &r : redactions) {
            if (r.category() == category) {
                ++n;
            }
        }
        return n;
    }
};

/**
 * @struct RedactionOptions
 * @brief Per-call options. An empty displayName disables the exact-match
 *        name pass but not the first-line name heuristic.
 */
struct RedactionOptions
{
    std::string displayName;

    RedactionOptions() = default;
    explicit RedactionOptions(const std::string &name)
        : displayName(name)
    {
    }
};

/**
 * @class PlaceholderCounters
 * @brief Per-category numbering for one engine invocation. Starts at zero
 *        for every call; never shared between calls.
 */
class PlaceholderCounters
{
public:
    PlaceholderCounters()
    {
        counts_.fill(0);
    }

    /**
     * @brief Advance the counter of @p category and return the new value (1-based).
     */
    size_t next(RedactionCategory category)
    {
        return ++counts_[static_cast<size_t>(category)];
    }

private:
    std::array<size_t, CATEGORY_COUNT> counts_;
};

} // namespace redact
} // namespace piiguard

#endif // PIIGUARD_REDACT_REDACTION_TYPES_HPP
