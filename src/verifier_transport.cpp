#include "verifier_transport.hpp"

#include <format>

#include <httplib.h>
#include <mw/url.hpp>
#include <spdlog/spdlog.h>

HTTPVerifierTransport::HTTPVerifierTransport(std::string origin,
                                             std::string target,
                                             std::chrono::milliseconds timeout)
    : origin(std::move(origin)), target(std::move(target)), timeout(timeout)
{
}

mw::E<std::unique_ptr<HTTPVerifierTransport>>
HTTPVerifierTransport::create(const std::string& verifier_url,
                              std::chrono::milliseconds timeout)
{
    ASSIGN_OR_RETURN(mw::URL url, mw::URL::fromStr(verifier_url));
    size_t scheme_end = verifier_url.find("://");
    if(scheme_end == std::string::npos || url.host().empty())
    {
        return std::unexpected(mw::runtimeError(
            "Invalid verifier URL: " + verifier_url));
    }

    std::string origin = verifier_url.substr(0, scheme_end + 3) +
        std::string(url.host());
    std::string port(url.port());
    if(!port.empty())
    {
        origin += ":" + port;
    }
    std::string target(url.path());
    if(target.empty())
    {
        target = "/";
    }
    std::string query(url.query());
    if(!query.empty())
    {
        target += "?" + query;
    }
    return std::unique_ptr<HTTPVerifierTransport>(
        new HTTPVerifierTransport(std::move(origin), std::move(target),
                                  timeout));
}

mw::E<TransportReply>
HTTPVerifierTransport::postJSON(const std::string& payload) const
{
    httplib::Client client(origin);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    spdlog::debug("Calling verifier at {}{}...", origin, target);
    httplib::Result res = client.Post(target, payload, "application/json");
    if(!res)
    {
        httplib::Error err = res.error();
        if(err == httplib::Error::ConnectionTimeout)
        {
            return std::unexpected(mw::runtimeError(std::format(
                "Verification timed out after {}ms", timeout.count())));
        }
        return std::unexpected(mw::runtimeError(
            "Verifier unreachable: " + httplib::to_string(err)));
    }

    TransportReply reply;
    reply.status = res->status;
    reply.body = res->body;
    return reply;
}
