#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <mw/error.hpp>

struct TransportReply
{
    int status = 0;
    std::string body;
};

class VerifierTransportInterface
{
public:
    virtual ~VerifierTransportInterface() = default;

    // POST a JSON document to the verifier endpoint. An error means no HTTP
    // response was obtained at all (unreachable, refused, timed out). Any
    // response, whatever its status, is returned as a reply.
    virtual mw::E<TransportReply> postJSON(const std::string& payload) const = 0;
};

// Talks to the verifier over HTTP(S) with cpp-httplib. Every call uses its
// own client, so one instance can serve many threads.
class HTTPVerifierTransport : public VerifierTransportInterface
{
public:
    static mw::E<std::unique_ptr<HTTPVerifierTransport>>
    create(const std::string& verifier_url, std::chrono::milliseconds timeout);

    mw::E<TransportReply> postJSON(const std::string& payload) const override;

private:
    HTTPVerifierTransport(std::string origin, std::string target,
                          std::chrono::milliseconds timeout);

    // scheme://host[:port]
    std::string origin;
    // path[?query]
    std::string target;
    std::chrono::milliseconds timeout;
};
