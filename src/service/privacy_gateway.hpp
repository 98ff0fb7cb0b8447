#ifndef PIIGUARD_SERVICE_PRIVACY_GATEWAY_HPP
#define PIIGUARD_SERVICE_PRIVACY_GATEWAY_HPP

#include <string>
#include <vector>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "config/guard_config.hpp"
#include "config/guard_params.hpp"
#include "redact/redaction_engine.hpp"
#include "redact/leakage_auditor.hpp"
#include "redact/placeholder.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

/**
 * @file privacy_gateway.hpp
 * @brief The caller-side flow around the redaction engine.
 *
 * DESIGN GOALS:
 *   - Inbound: validate each named text field against its length bounds,
 *     then redact every field with the same options. Each field is its own
 *     engine call, so placeholder numbering restarts per field.
 *   - Outbound: redact the model's reply again and audit the result for
 *     email/URL residue.
 *   - The LLM call sits between the two and is not part of this class.
 *   - Log lines carry field names, sizes, per-category counts and a short
 *     SHA-256 fingerprint. Never the text.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::service;
 *   PrivacyGateway gateway(guardConfig);
 *   auto inbound = gateway.redactInbound({{"resumeText", resume}, {"jobText", job}}, "Max Mustermann");
 *   // ... send inbound[i].result.text to the model together with privacyInstruction() ...
 *   auto outbound = gateway.sanitizeOutbound(modelReply, "Max Mustermann");
 *   if (!outbound.leakage.clean()) { ... }
 *   @endcode
 */

namespace piiguard {
namespace service {

/**
 * @struct InboundField
 */
struct InboundField
{
    std::string name;
    std::string text;
};

/**
 * @struct FieldResult
 */
struct FieldResult
{
    std::string name;
    piiguard::redact::RedactionResult result;
};

/**
 * @struct OutboundResult
 */
struct OutboundResult
{
    piiguard::redact::RedactionResult result;
    piiguard::redact::LeakageReport leakage;
};

/**
 * @class PrivacyGateway
 * @brief Validates and redacts request texts; immutable after construction.
 */
class PrivacyGateway
{
public:
    explicit PrivacyGateway(const piiguard::config::GuardConfig &config)
        : limits_(piiguard::config::getDefaultFieldLimits()),
          defaultDisplayName_(config.displayName)
    {
        for (auto &limit : limits_) {
            if (limit.name == "jobText") {
                limit.maxLength = config.maxJobChars;
            } else if (limit.name == "resumeText" || limit.name == "resumeBefore"
                       || limit.name == "resumeAfter") {
                limit.maxLength = config.maxResumeChars;
            } else if (limit.name == "answers") {
                limit.maxLength = config.maxAnswerChars;
            }
        }
    }

    /**
     * @brief Validate and redact the inbound fields.
     * @param displayName the request's name; empty falls back to the configured one
     * @throw std::runtime_error naming the first field or name that violates its bounds.
     *        No field is redacted when validation fails.
     */
    std::vector<FieldResult> redactInbound(const std::vector<InboundField> &fields,
                                           const std::string &displayName) const
    {
        if (fields.empty()) {
            throw std::runtime_error("PrivacyGateway: inbound request has no fields.");
        }
        const piiguard::redact::RedactionOptions options(resolveDisplayName(displayName));

        for (size_t i = 0; i < fields.size(); ++i) {
            for (size_t j = 0; j < i; ++j) {
                if (fields[j].name == fields[i].name) {
                    throw std::runtime_error("PrivacyGateway: duplicate field '" + fields[i].name + "'.");
                }
            }
            validateField(fields[i]);
        }

        std::vector<FieldResult> results;
        results.reserve(fields.size());
        for (const auto &field : fields) {
            FieldResult fr;
            fr.name = field.name;
            fr.result = engine_.redact(field.text, options);
            piiguard::util::logger::info("PrivacyGateway: inbound field '" + field.name + "' ("
                                         + std::to_string(field.text.size()) + " bytes, fp="
                                         + piiguard::util::hashing::fingerprint(field.text) + ") "
                                         + summarize(fr.result));
            results.push_back(std::move(fr));
        }
        return results;
    }

    /**
     * @brief Redact model output and audit what is left.
     * @throw std::runtime_error only for an invalid display name.
     */
    OutboundResult sanitizeOutbound(const std::string &text, const std::string &displayName) const
    {
        const piiguard::redact::RedactionOptions options(resolveDisplayName(displayName));

        OutboundResult out;
        out.result = engine_.redact(text, options);
        out.leakage = piiguard::redact::auditLeakage(out.result.text);

        piiguard::util::logger::info("PrivacyGateway: outbound text (" + std::to_string(text.size())
                                     + " bytes, fp=" + piiguard::util::hashing::fingerprint(text) + ") "
                                     + summarize(out.result));
        if (!out.leakage.clean()) {
            piiguard::util::logger::warn(std::string("PrivacyGateway: leakage after outbound redaction: hasEmail=")
                                         + (out.leakage.hasEmail ? "true" : "false")
                                         + " hasUrl=" + (out.leakage.hasUrl ? "true" : "false"));
        }
        return out;
    }

    /**
     * @brief Audit a text without redacting it.
     */
    piiguard::redact::LeakageReport audit(const std::string &text) const
    {
        piiguard::redact::LeakageReport report = piiguard::redact::auditLeakage(text);
        piiguard::util::logger::debug("PrivacyGateway: audit fp=" + piiguard::util::hashing::fingerprint(text)
                                      + (report.clean() ? " clean" : " leakage"));
        return report;
    }

    /**
     * @brief Privacy rules for the model's system prompt, quoting the
     *        placeholder vocabulary the model must reuse.
     */
    static std::string privacyInstruction()
    {
        using piiguard::redact::RedactionCategory;
        using piiguard::redact::placeholderToken;

        const RedactionCategory quoted[] = {
            RedactionCategory::Name, RedactionCategory::Email, RedactionCategory::Phone,
            RedactionCategory::Address, RedactionCategory::PostalCode, RedactionCategory::DateOfBirth
        };
        std::ostringstream oss;
        oss << "IMPORTANT PRIVACY RULES: Never output personal identifiers (real names, emails, "
               "phone numbers, street addresses, postal codes, exact DOB). Use placeholders like ";
        bool first = true;
        for (RedactionCategory c : quoted) {
            if (!first) {
                oss << ", ";
            }
            oss << placeholderToken(c, 1);
            first = false;
        }
        oss << ". Keep every placeholder exactly as written. Do not invent facts. "
               "Only use the provided inputs.";
        return oss.str();
    }

    const std::vector<piiguard::config::FieldLimit>& fieldLimits() const
    {
        return limits_;
    }

private:
    /**
     * @brief The request's name if it has one, else the configured default.
     * @throw std::runtime_error if the chosen name is shorter than the minimum.
     */
    std::string resolveDisplayName(const std::string &requested) const
    {
        std::string name = piiguard::util::utf8::trim(requested);
        if (name.empty()) {
            name = piiguard::util::utf8::trim(defaultDisplayName_);
        }
        if (!name.empty() && name.size() < piiguard::config::MIN_DISPLAY_NAME_LENGTH) {
            throw std::runtime_error("PrivacyGateway: displayName must be at least "
                                     + std::to_string(piiguard::config::MIN_DISPLAY_NAME_LENGTH)
                                     + " characters.");
        }
        return name;
    }

    void validateField(const InboundField &field) const
    {
        for (const auto &limit : limits_) {
            if (limit.name != field.name) {
                continue;
            }
            if (field.text.size() < limit.minLength) {
                throw std::runtime_error("PrivacyGateway: field '" + field.name + "' is shorter than "
                                         + std::to_string(limit.minLength) + " characters.");
            }
            if (field.text.size() > limit.maxLength) {
                throw std::runtime_error("PrivacyGateway: field '" + field.name + "' exceeds "
                                         + std::to_string(limit.maxLength) + " characters.");
            }
            return;
        }
        throw std::runtime_error("PrivacyGateway: unknown field '" + field.name + "'.");
    }

    /**
     * @brief "3 redactions [EMAIL:1 PHONE:2]"
     */
    static std::string summarize(const piiguard::redact::RedactionResult &result)
    {
        std::ostringstream oss;
        oss << result.redactions.size() << " redactions [";
        bool first = true;
        for (auto c : piiguard::redact::allCategories()) {
            const size_t n = result.countOf(c);
            if (n == 0) {
                continue;
            }
            if (!first) {
                oss << " ";
            }
            oss << piiguard::redact::placeholderLabel(c) << ":" << n;
            first = false;
        }
        oss << "]";
        return oss.str();
    }

    std::vector<piiguard::config::FieldLimit> limits_;
    std::string defaultDisplayName_;
    piiguard::redact::RedactionEngine engine_;
};

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_PRIVACY_GATEWAY_HPP
