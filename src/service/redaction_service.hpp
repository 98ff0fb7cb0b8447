#ifndef PIIGUARD_SERVICE_REDACTION_SERVICE_HPP
#define PIIGUARD_SERVICE_REDACTION_SERVICE_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include "service/request.hpp"
#include "service/response.hpp"
#include "service/privacy_gateway.hpp"
#include "util/logger.hpp"

namespace piiguard {
namespace service {

/*
  redaction_service.hpp
  --------------------------------
  Receives parsed requests (from the CLI today, from any RPC front end
  tomorrow) and routes them to the PrivacyGateway.

  Modes:
    "inbound"  : validate + redact req.fields           -> fields, redactions
    "outbound" : redact req.text, audit the result       -> fields["text"], redactions, leakage
    "audit"    : audit req.text as-is, no redaction      -> leakage

  Status codes:
    200 on success, 400 for an unknown mode, missing input or a validation
    error raised by the gateway.

  THREAD-SAFETY:
   - The gateway is immutable and the engine stateless, so HandleRequest
     needs no locking.
*/

class RedactionService
{
public:
    explicit RedactionService(const PrivacyGateway &gateway)
        : m_gateway(gateway)
    {
    }

    Response HandleRequest(const Request &req) const
    {
        try
        {
            if (req.mode == "inbound")
            {
                return handleInbound(req);
            }
            else if (req.mode == "outbound")
            {
                return handleOutbound(req);
            }
            else if (req.mode == "audit")
            {
                Response resp(200, "OK");
                resp.setLeakage(m_gateway.audit(req.text));
                return resp;
            }
            else
            {
                piiguard::util::logger::warn("RedactionService: unknown mode '" + req.mode + "'");
                return Response(400, "Unknown mode: " + req.mode);
            }
        }
        catch (const std::runtime_error &ex)
        {
            piiguard::util::logger::error(std::string("RedactionService: request rejected: ") + ex.what());
            return Response(400, ex.what());
        }
    }

private:
    Response handleInbound(const Request &req) const
    {
        std::vector<InboundField> fields;
        fields.reserve(req.fields.size());
        for (const auto &kv : req.fields)
        {
            fields.push_back({kv.first, kv.second});
        }

        auto results = m_gateway.redactInbound(fields, req.displayName);

        Response resp(200, "OK");
        for (auto &fr : results)
        {
            resp.fields.emplace_back(fr.name, fr.result.text);
            for (const auto &r : fr.result.redactions)
            {
                resp.redactions.push_back({fr.name, r});
            }
        }
        return resp;
    }

    Response handleOutbound(const Request &req) const
    {
        OutboundResult out = m_gateway.sanitizeOutbound(req.text, req.displayName);

        Response resp(200, "OK");
        resp.fields.emplace_back("text", out.result.text);
        for (const auto &r : out.result.redactions)
        {
            resp.redactions.push_back({"text", r});
        }
        resp.setLeakage(out.leakage);
        return resp;
    }

    const PrivacyGateway &m_gateway;
};

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_REDACTION_SERVICE_HPP
