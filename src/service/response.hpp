#ifndef PIIGUARD_SERVICE_RESPONSE_HPP
#define PIIGUARD_SERVICE_RESPONSE_HPP

#include <string>
#include <vector>
#include <utility>
#include <sstream>
#include <iomanip>
#include <cstddef>
#include "redact/redaction_types.hpp"
#include "redact/placeholder.hpp"
#include "redact/leakage_auditor.hpp"

/**
 * @file response.hpp
 * @brief JSON response returned by the redaction service.
 *
 * DESIGN GOALS:
 *   - A minimal "Response" struct: status code, message, redacted fields,
 *     the audit list (tagged with the field it came from) and an optional
 *     leakage report.
 *   - toJson() produces the wire form; non-ASCII UTF-8 is passed through.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::service;
 *   Response resp(200, "OK");
 *   resp.fields.emplace_back("text", "[NAME_1]\n[EMAIL_1]");
 *   std::string jsonOut = resp.toJson();
 *   // => {"status":200,"message":"OK","fields":{"text":"[NAME_1]\n[EMAIL_1]"},"redactions":[]}
 *   @endcode
 */

namespace piiguard {
namespace service {

/**
 * @struct FieldRedaction
 * @brief An audit record plus the name of the field it belongs to.
 */
struct FieldRedaction
{
    std::string field;
    piiguard::redact::Redaction redaction;
};

/**
 * @struct Response
 */
struct Response
{
    int statusCode;       ///< 200 on success, 400 for a rejected request
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
    std::vector<FieldRedaction> redactions;
    bool hasLeakage;      ///< whether "leakage" is emitted
    piiguard::redact::LeakageReport leakage;

    Response(int code = 200, const std::string &msg = "OK")
        : statusCode(code), message(msg), hasLeakage(false)
    {
    }

    void setLeakage(const piiguard::redact::LeakageReport &report)
    {
        leakage = report;
        hasLeakage = true;
    }

    inline std::string toJson() const
    {
        std::ostringstream oss;
        oss << "{";
        oss << R"("status":)" << statusCode << ",";
        oss << R"("message":")" << escapeString(message) << "\",";

        oss << R"("fields":{)";
        bool first = true;
        for (const auto &kv : fields) {
            if (!first) {
                oss << ",";
            }
            oss << "\"" << escapeString(kv.first) << "\":\"" << escapeString(kv.second) << "\"";
            first = false;
        }
        oss << "},";

        oss << R"("redactions":[)";
        first = true;
        for (const auto &entry : redactions) {
            if (!first) {
                oss << ",";
            }
            const auto &r = entry.redaction;
            oss << "{"
                << R"("field":")" << escapeString(entry.field) << "\","
                << R"("category":")" << piiguard::redact::placeholderLabel(r.category()) << "\","
                << R"("match":")" << escapeString(r.match()) << "\","
                << R"("offset":)" << r.offset() << ","
                << R"("replacement":")" << escapeString(r.replacement()) << "\""
                << "}";
            first = false;
        }
        oss << "]";

        if (hasLeakage) {
            oss << R"(,"leakage":{"hasEmail":)" << (leakage.hasEmail ? "true" : "false")
                << R"(,"hasUrl":)" << (leakage.hasUrl ? "true" : "false") << "}";
        }
        oss << "}";
        return oss.str();
    }

private:
    /**
     * @brief Escape characters in a string for JSON, e.g. " -> \".
     */
    inline static std::string escapeString(const std::string &in)
    {
        std::ostringstream oss;
        for (char c : in) {
            switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b";  break;
            case '\f': oss << "\\f";  break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << (int)(unsigned char)c << std::dec;
                } else {
                    oss << c;
                }
                break;
            }
        }
        return oss.str();
    }
};

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_RESPONSE_HPP
