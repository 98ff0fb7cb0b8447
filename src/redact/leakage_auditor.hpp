#ifndef PIIGUARD_REDACT_LEAKAGE_AUDITOR_HPP
#define PIIGUARD_REDACT_LEAKAGE_AUDITOR_HPP

#include <string>
#include <re2/re2.h>
#include "redact/redaction_stages.hpp"

/**
 * @file leakage_auditor.hpp
 * @brief Cheap post-check for email and http(s) URL residue.
 *
 * The auditor reports, it never redacts and never modifies its input.
 * Callers decide whether a positive report means retry, warn or reject.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto report = piiguard::redact::auditLeakage(modelOutput);
 *   if (!report.clean()) { ... }
 *   @endcode
 */

namespace piiguard {
namespace redact {

/**
 * @struct LeakageReport
 */
struct LeakageReport
{
    bool hasEmail = false;
    bool hasUrl = false;

    bool clean() const { return !hasEmail && !hasUrl; }
};

inline LeakageReport auditLeakage(const std::string &text)
{
    static const RE2 urlPattern(R"(\bhttps?://)", detail::caseInsensitive());

    LeakageReport report;
    report.hasEmail = RE2::PartialMatch(text, emailPattern());
    report.hasUrl = RE2::PartialMatch(text, urlPattern);
    return report;
}

} // namespace redact
} // namespace piiguard

#endif // PIIGUARD_REDACT_LEAKAGE_AUDITOR_HPP
