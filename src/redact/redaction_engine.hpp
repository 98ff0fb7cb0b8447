#ifndef PIIGUARD_REDACT_REDACTION_ENGINE_HPP
#define PIIGUARD_REDACT_REDACTION_ENGINE_HPP

#include <string>
#include <vector>
#include "redact/redaction_types.hpp"
#include "redact/placeholder.hpp"
#include "redact/redaction_stages.hpp"
#include "redact/name_detection.hpp"

/**
 * @file redaction_engine.hpp
 * @brief Runs the category stages over one input and returns a RedactionResult.
 *
 * STAGE ORDER (fixed):
 *   1. Email        2. Url          3. Phone
 *   4. PostalCode   5. Address      6. DateOfBirth
 *   7. Date         8. Id           9. Name (display name, then name line)
 *
 * Later stages must not see the identifiers earlier ones consumed, and some
 * decisions read the partially redacted text (the postal-code year check,
 * DOB before generic dates). Reordering changes results.
 *
 * GUARANTEES:
 *   - Never throws for any input, including empty, non-UTF-8 or text that
 *     already contains placeholders. Zero matches returns the input
 *     unchanged with an empty audit list.
 *   - Stateless: counters live in the per-call RedactionPass, so concurrent
 *     calls need no synchronisation.
 *   - Running the engine on its own output adds no redactions for any
 *     category except names (the name line is consumed on the first run).
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::redact;
 *   RedactionEngine engine;
 *   RedactionResult r = engine.redact("Max Mustermann\nmax@example.com",
 *                                     RedactionOptions("Max Mustermann"));
 *   // r.text == "[NAME_1]\n[EMAIL_1]"
 *   @endcode
 */

namespace piiguard {
namespace redact {

/**
 * @struct RedactionStage
 * @brief One entry of the ordered stage list.
 */
struct RedactionStage
{
    RedactionCategory category;
    const char* name;
    void (*apply)(RedactionPass &pass, const RedactionOptions &options);
};

/**
 * @brief The stages in the order they run.
 */
inline const std::vector<RedactionStage>& orderedStages()
{
    static const std::vector<RedactionStage> stages = {
        {RedactionCategory::Email, "email",
            [](RedactionPass &p, const RedactionOptions &) { applyEmailStage(p); }},
        {RedactionCategory::Url, "url",
            [](RedactionPass &p, const RedactionOptions &) { applyUrlStage(p); }},
        {RedactionCategory::Phone, "phone",
            [](RedactionPass &p, const RedactionOptions &) { applyPhoneStage(p); }},
        {RedactionCategory::PostalCode, "postal-code",
            [](RedactionPass &p, const RedactionOptions &) { applyPostalCodeStage(p); }},
        {RedactionCategory::Address, "address",
            [](RedactionPass &p, const RedactionOptions &) { applyAddressStage(p); }},
        {RedactionCategory::DateOfBirth, "date-of-birth",
            [](RedactionPass &p, const RedactionOptions &) { applyDateOfBirthStage(p); }},
        {RedactionCategory::Date, "date",
            [](RedactionPass &p, const RedactionOptions &) { applyDateStage(p); }},
        {RedactionCategory::Id, "id",
            [](RedactionPass &p, const RedactionOptions &) { applyIdStage(p); }},
        {RedactionCategory::Name, "display-name",
            [](RedactionPass &p, const RedactionOptions &o) { applyDisplayNameStage(p, o.displayName); }},
        {RedactionCategory::Name, "name-line",
            [](RedactionPass &p, const RedactionOptions &) { applyNameLineStage(p); }},
    };
    return stages;
}

/**
 * @class RedactionEngine
 * @brief Stateless front end over orderedStages().
 */
class RedactionEngine
{
public:
    RedactionEngine() = default;

    RedactionResult redact(const std::string &text,
                           const RedactionOptions &options = RedactionOptions()) const
    {
        RedactionPass pass(text);
        for (const auto &stage : orderedStages()) {
            stage.apply(pass, options);
        }

        RedactionResult result;
        result.text.swap(pass.text);
        result.redactions.swap(pass.redactions);
        return result;
    }
};

/**
 * @brief Convenience wrapper: RedactionEngine().redact(text, options).
 */
inline RedactionResult redact(const std::string &text,
                              const RedactionOptions &options = RedactionOptions())
{
    return RedactionEngine().redact(text, options);
}

} // namespace redact
} // namespace piiguard

#endif // PIIGUARD_REDACT_REDACTION_ENGINE_HPP
