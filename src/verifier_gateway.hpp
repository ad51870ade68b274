#pragma once

#include <future>
#include <memory>

#include <nlohmann/json.hpp>

#include "types.hpp"
#include "verification_outcome.hpp"
#include "verifier_transport.hpp"

// Performs the single outbound verification call for a signed request and
// folds every possible answer into a VerificationOutcome. Nothing thrown or
// returned by the transport escapes this class.
class VerifierGateway
{
public:
    explicit VerifierGateway(
        std::unique_ptr<VerifierTransportInterface> transport);

    VerificationOutcome verify(const RequestView& req) const;
    // Same as verify(), on another thread. The request is owned by the call.
    std::future<VerificationOutcome> verifyAsync(VerificationRequest req) const;

    // The JSON document sent to the verifier. The body is included only for
    // methods that carry one, and only when the host supplied it.
    static nlohmann::json envelope(const RequestView& req,
                                   const ForwardedHeaders& headers);
    static VerificationOutcome interpretReply(const TransportReply& reply);

private:
    std::unique_ptr<VerifierTransportInterface> transport;
};
