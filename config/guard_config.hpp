#ifndef PIIGUARD_CONFIG_GUARD_CONFIG_HPP
#define PIIGUARD_CONFIG_GUARD_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file guard_config.hpp
 * @brief Local configuration of a PII Guard process.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp.
 *   - Holds logging settings, the fallback display name and field limits.
 */

namespace piiguard {
namespace config {

/**
 * @struct GuardConfig
 * @brief Settings read from a key=value file:
 *   - logLevel: minimal level name for the logger ("debug" .. "critical").
 *   - logFile: optional log file path; empty keeps console only.
 *   - displayName: used when a request does not declare its own.
 *   - maxJobChars / maxResumeChars / maxAnswerChars: field maxima.
 */
struct GuardConfig
{
    GuardConfig()
        : logLevel("info"),
          logFile(""),
          displayName(""),
          maxJobChars(12000),
          maxResumeChars(30000),
          maxAnswerChars(2000)
    {
    }

    std::string logLevel;

    std::string logFile;

    /// The user's declared legal name; empty disables the exact-match name pass.
    std::string displayName;

    uint64_t maxJobChars;
    uint64_t maxResumeChars;
    uint64_t maxAnswerChars;
};

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_GUARD_CONFIG_HPP
