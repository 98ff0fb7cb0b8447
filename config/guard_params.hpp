#ifndef PIIGUARD_CONFIG_GUARD_PARAMS_HPP
#define PIIGUARD_CONFIG_GUARD_PARAMS_HPP

#include <string>
#include <cstdint>
#include <vector>

/**
 * @file guard_params.hpp
 * @brief Input limits for the text fields the gateway accepts.
 *
 * Each inbound request carries named text fields: the job ad, the résumé,
 * clarification answers, and the résumé before and after an edit when two
 * versions are scored against each other. Their length bounds (in bytes)
 * match what the upstream LLM prompts were sized for.
 *
 * Example usage:
 *  @code
 *    auto limits = piiguard::config::getDefaultFieldLimits();
 *    for (const auto &f : limits) { ... f.name, f.minLength, f.maxLength ... }
 *  @endcode
 */

namespace piiguard {
namespace config {

/**
 * @struct FieldLimit
 * @brief Name and accepted length range of one inbound text field.
 */
struct FieldLimit
{
    std::string name;
    uint64_t minLength;
    uint64_t maxLength;
};

/// Minimum length of a declared display name after trimming.
constexpr uint64_t MIN_DISPLAY_NAME_LENGTH = 2;

/**
 * @brief Default limits per inbound field. The two résumé versions share
 *        the résumé maximum.
 */
inline std::vector<FieldLimit> getDefaultFieldLimits()
{
    return {
        {"jobText",      50, 12000},
        {"resumeText",   50, 30000},
        {"answers",       1,  2000},
        {"resumeBefore", 50, 30000},
        {"resumeAfter",  50, 30000},
    };
}

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_GUARD_PARAMS_HPP
