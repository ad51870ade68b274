#include "verification_outcome.hpp"

VerificationOutcome VerificationOutcome::failure(Status status,
                                                 std::string error)
{
    VerificationOutcome outcome;
    outcome.verified = false;
    outcome.error = std::move(error);
    outcome.status = status;
    return outcome;
}

mw::E<VerificationOutcome> VerificationOutcome::fromJSON(std::string_view body)
{
    nlohmann::json j = nlohmann::json::parse(body.begin(), body.end(),
                                              nullptr, false);
    if(j.is_discarded() || !j.is_object())
    {
        return std::unexpected(mw::runtimeError(
            "Verifier response is not a JSON object"));
    }

    VerificationOutcome outcome;
    if(auto it = j.find("verified"); it != j.end() && !it->is_null())
    {
        if(it->is_boolean())
        {
            outcome.verified = it->get<bool>();
        }
        else if(it->is_number())
        {
            outcome.verified = it->get<double>() != 0.0;
        }
        else
        {
            return std::unexpected(mw::runtimeError(
                "Field 'verified' is not a boolean"));
        }
    }
    if(auto it = j.find("agent"); it != j.end() && !it->is_null())
    {
        if(!it->is_object())
        {
            return std::unexpected(mw::runtimeError(
                "Field 'agent' is not an object"));
        }
        outcome.agent = *it;
    }
    if(auto it = j.find("error"); it != j.end() && !it->is_null())
    {
        if(!it->is_string())
        {
            return std::unexpected(mw::runtimeError(
                "Field 'error' is not a string"));
        }
        outcome.error = it->get<std::string>();
    }
    auto read_timestamp = [&j](const char* key, std::optional<int64_t>& field)
        -> mw::E<void>
    {
        auto it = j.find(key);
        if(it == j.end() || it->is_null())
        {
            return {};
        }
        if(it->is_number_integer())
        {
            field = it->get<int64_t>();
            return {};
        }
        if(it->is_number_float())
        {
            field = static_cast<int64_t>(it->get<double>());
            return {};
        }
        return std::unexpected(mw::runtimeError(
            std::string("Field '") + key + "' is not a number"));
    };
    DO_OR_RETURN(read_timestamp("created", outcome.created));
    DO_OR_RETURN(read_timestamp("expires", outcome.expires));

    outcome.status = outcome.verified ? VERIFIED : REJECTED;
    return outcome;
}

nlohmann::json VerificationOutcome::toJSON() const
{
    nlohmann::json j = {{"verified", verified}};
    if(agent.has_value())
    {
        j["agent"] = *agent;
    }
    if(error.has_value())
    {
        j["error"] = *error;
    }
    if(created.has_value())
    {
        j["created"] = *created;
    }
    if(expires.has_value())
    {
        j["expires"] = *expires;
    }
    return j;
}

std::string_view statusStr(VerificationOutcome::Status status)
{
    switch(status)
    {
    case VerificationOutcome::VERIFIED:
        return "verified";
    case VerificationOutcome::REJECTED:
        return "rejected";
    case VerificationOutcome::MISSING_HEADER:
        return "missing-header";
    case VerificationOutcome::SENSITIVE_HEADER:
        return "sensitive-header";
    case VerificationOutcome::SERVICE_ERROR:
        return "service-error";
    case VerificationOutcome::TRANSPORT_FAULT:
        return "transport-fault";
    }
    return "unknown";
}
