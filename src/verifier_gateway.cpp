#include "verifier_gateway.hpp"

#include <format>

#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "forwarding_policy.hpp"

namespace
{

bool hasNonEmpty(const HeaderMap& headers, std::string_view name)
{
    auto it = headers.find(name);
    return it != headers.end() && !it->second.empty();
}

} // namespace

VerifierGateway::VerifierGateway(
    std::unique_ptr<VerifierTransportInterface> transport)
    : transport(std::move(transport))
{
}

nlohmann::json VerifierGateway::envelope(const RequestView& req,
                                         const ForwardedHeaders& headers)
{
    std::string method(req.method);
    mw::toUpper(method);
    nlohmann::json j = {
        {"method", method},
        {"url", std::string(req.url)},
        {"headers", headers},
    };
    if(req.body.has_value() && !req.body->empty() &&
       methodCarriesBody(req.method))
    {
        j["body"] = std::string(*req.body);
    }
    return j;
}

VerificationOutcome VerifierGateway::interpretReply(const TransportReply& reply)
{
    if(reply.status >= 500)
    {
        spdlog::warn("Verifier service error: HTTP {}.", reply.status);
        std::string error = "Verifier service error";
        nlohmann::json j = nlohmann::json::parse(reply.body, nullptr, false);
        if(j.is_object())
        {
            if(auto it = j.find("error"); it != j.end() && it->is_string())
            {
                error = it->get<std::string>();
            }
        }
        return VerificationOutcome::failure(VerificationOutcome::SERVICE_ERROR,
                                            std::move(error));
    }

    auto outcome = VerificationOutcome::fromJSON(reply.body);
    if(!outcome.has_value())
    {
        spdlog::warn("Unusable verifier response (HTTP {}): {}", reply.status,
                     mw::errorMsg(outcome.error()));
        return VerificationOutcome::failure(
            VerificationOutcome::TRANSPORT_FAULT,
            std::format("Invalid verifier response: {}", reply.status));
    }
    return *std::move(outcome);
}

VerificationOutcome VerifierGateway::verify(const RequestView& req) const
{
    if(!isSigned(req.headers))
    {
        return VerificationOutcome::failure(
            VerificationOutcome::MISSING_HEADER,
            "No signature headers present");
    }
    if(!hasNonEmpty(req.headers, HEADER_SIGNATURE_INPUT))
    {
        return VerificationOutcome::failure(
            VerificationOutcome::MISSING_HEADER,
            "Missing Signature-Input header (request has signature headers "
            "but Signature-Input is required)");
    }
    if(!hasNonEmpty(req.headers, HEADER_SIGNATURE))
    {
        return VerificationOutcome::failure(
            VerificationOutcome::MISSING_HEADER,
            "Missing Signature header (request has Signature-Input but "
            "Signature is required)");
    }

    auto forwarded = buildForwardSet(req.headers);
    if(!forwarded.has_value())
    {
        return VerificationOutcome::failure(
            VerificationOutcome::SENSITIVE_HEADER,
            mw::errorMsg(forwarded.error()));
    }

    spdlog::debug("Verifying {} {} with {} forwarded headers.", req.method,
                  req.url, forwarded->size());
    // Bodies and obs-text header values need not be UTF-8. Invalid bytes
    // become U+FFFD.
    std::string payload = envelope(req, *forwarded).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto reply = transport->postJSON(payload);
    if(!reply.has_value())
    {
        std::string msg = mw::errorMsg(reply.error());
        spdlog::warn("Verifier call failed: {}", msg);
        return VerificationOutcome::failure(
            VerificationOutcome::TRANSPORT_FAULT, std::move(msg));
    }

    VerificationOutcome outcome = interpretReply(*reply);
    spdlog::debug("Verifier answered HTTP {}: {}.", reply->status,
                  statusStr(outcome.status));
    return outcome;
}

std::future<VerificationOutcome>
VerifierGateway::verifyAsync(VerificationRequest req) const
{
    return std::async(std::launch::async,
                      [this, req = std::move(req)]()
                      {
                          return verify(req.view());
                      });
}
