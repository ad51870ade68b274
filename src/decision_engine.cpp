#include "decision_engine.hpp"

#include <spdlog/spdlog.h>

#include "forwarding_policy.hpp"

namespace
{

Rejection unauthorized(std::string error)
{
    return Rejection{401, {{"error", std::move(error)}}};
}

} // namespace

std::string_view markerStr(Decision::Marker marker)
{
    switch(marker)
    {
    case Decision::ALLOW:
        return "allow";
    case Decision::OBSERVE:
        return "observe";
    case Decision::DENY:
        return "deny";
    }
    return "deny";
}

DecisionEngine::DecisionEngine(const EnforcementConfig& conf,
                               std::unique_ptr<VerifierGateway> gateway)
    : conf(conf), gateway(std::move(gateway))
{
}

Decision DecisionEngine::evaluate(const RequestView& req) const
{
    return evaluate(req, conf.mode);
}

Decision DecisionEngine::evaluate(const RequestView& req,
                                  EnforcementMode mode) const
{
    Decision decision;
    if(!isSigned(req.headers))
    {
        decision.phase = Decision::UNSIGNED;
        decision.state = {false, std::nullopt};
        if(mode == EnforcementMode::REQUIRE)
        {
            spdlog::info("Denying unsigned request {} {}.", req.method,
                         req.url);
            decision.short_circuit =
                unauthorized("Missing OpenBotAuth signature headers");
            decision.marker = Decision::DENY;
        }
        else
        {
            decision.marker = Decision::OBSERVE;
        }
        return decision;
    }

    decision.phase = Decision::SIGNED_PENDING;
    spdlog::debug("Signed request {} {}, verifying...", req.method, req.url);
    VerificationOutcome outcome = gateway->verify(req);
    decision.state = {true, outcome};

    if(outcome.verified)
    {
        decision.phase = Decision::SIGNED_VERIFIED;
        decision.marker = Decision::ALLOW;
        return decision;
    }

    decision.phase = Decision::SIGNED_REJECTED;
    if(mode == EnforcementMode::REQUIRE)
    {
        spdlog::info("Denying {} {}: {} ({}).", req.method, req.url,
                     outcome.error.value_or("no error given"),
                     statusStr(outcome.status));
        decision.short_circuit = unauthorized(
            outcome.error.value_or("Signature verification failed"));
        decision.marker = Decision::DENY;
    }
    else
    {
        spdlog::info("Observed failed verification for {} {}: {} ({}).",
                     req.method, req.url,
                     outcome.error.value_or("no error given"),
                     statusStr(outcome.status));
        decision.marker = Decision::OBSERVE;
    }
    return decision;
}

std::future<Decision> DecisionEngine::evaluateAsync(VerificationRequest req) const
{
    return std::async(std::launch::async,
                      [this, req = std::move(req)]()
                      {
                          return evaluate(req.view());
                      });
}
