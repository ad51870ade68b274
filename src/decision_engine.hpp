#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "types.hpp"
#include "verification_outcome.hpp"
#include "verifier_gateway.hpp"

// Response header carrying the decision marker.
constexpr char DECISION_HEADER[] = "X-OBA-Decision";

// What the host learns about one request. Created once by the engine and
// handed over by value.
struct RequestSignatureState
{
    bool is_signed = false;
    // Set iff the request is signed and verification was attempted.
    std::optional<VerificationOutcome> result;
};

// The response a host emits instead of running its handler.
struct Rejection
{
    int status = 401;
    nlohmann::json body;
};

struct Decision
{
    // SIGNED_PENDING only holds while the verifier call is in flight; a
    // returned decision is always in one of the other phases.
    enum Phase { UNSIGNED, SIGNED_PENDING, SIGNED_VERIFIED, SIGNED_REJECTED };
    enum Marker { ALLOW, OBSERVE, DENY };

    Phase phase = UNSIGNED;
    RequestSignatureState state;
    // When set, the host must not run its handler and responds with this.
    std::optional<Rejection> short_circuit;
    // Attached to the final response, after the handler has produced it.
    Marker marker = OBSERVE;

    bool proceed() const { return !short_circuit.has_value(); }
};

std::string_view markerStr(Decision::Marker marker);

class DecisionEngine
{
public:
    DecisionEngine(const EnforcementConfig& conf,
                   std::unique_ptr<VerifierGateway> gateway);

    // Evaluate with the configured mode.
    Decision evaluate(const RequestView& req) const;
    // Evaluate with `mode` instead of the configured mode. Hosts use this to
    // enforce only part of their URL space.
    Decision evaluate(const RequestView& req, EnforcementMode mode) const;
    std::future<Decision> evaluateAsync(VerificationRequest req) const;

    const EnforcementConfig& config() const { return conf; }

private:
    const EnforcementConfig conf;
    std::unique_ptr<VerifierGateway> gateway;
};
