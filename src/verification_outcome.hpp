#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <mw/error.hpp>
#include <nlohmann/json.hpp>

struct VerificationOutcome
{
    // Why the outcome is what it is. The JSON shape exchanged with the
    // verifier does not carry this; it lets callers tell an unreachable
    // verifier apart from a rejected signature.
    enum Status
    {
        VERIFIED,
        // The verifier judged the signature invalid.
        REJECTED,
        // Some but not all of the signature headers are present.
        MISSING_HEADER,
        // The signature covers a credential-bearing header.
        SENSITIVE_HEADER,
        // The verifier answered with a 5xx status.
        SERVICE_ERROR,
        // No usable answer: unreachable, timed out, or unparseable body.
        TRANSPORT_FAULT,
    };

    bool verified = false;
    std::optional<nlohmann::json> agent;
    std::optional<std::string> error;
    std::optional<int64_t> created;
    std::optional<int64_t> expires;
    Status status = REJECTED;

    static VerificationOutcome failure(Status status, std::string error);

    // Parse a verifier response body. `verified` defaults to false when
    // absent. Fails if the body is not a JSON object or a field has the wrong
    // type.
    static mw::E<VerificationOutcome> fromJSON(std::string_view body);
    nlohmann::json toJSON() const;

    bool isFault() const
    {
        return status == SERVICE_ERROR || status == TRANSPORT_FAULT;
    }
};

std::string_view statusStr(VerificationOutcome::Status status);
