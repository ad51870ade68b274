#pragma once

#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <mw/error.hpp>

#include "config.hpp"
#include "decision_engine.hpp"
#include "types.hpp"

// A reverse proxy in front of an upstream HTTP server. Every request goes
// through the decision engine; requests that are not short-circuited are
// passed upstream with X-OBAuth-* headers describing the verification.
class Sidecar
{
public:
    Sidecar() = delete;
    Sidecar(const SidecarConfig& conf, std::unique_ptr<DecisionEngine> engine);
    ~Sidecar();

    // Bind and start serving on a background thread.
    mw::E<void> start();
    void stop();
    void wait();

    void handleHealth(httplib::Response& res) const;
    void handleRequest(const httplib::Request& req,
                       httplib::Response& res) const;

    // Headers of `req`, with repeated headers joined by ", ".
    static HeaderMap collectHeaders(const httplib::Request& req);
    // The absolute URL the client asked for, honoring X-Forwarded-Proto and
    // X-Forwarded-Host.
    static std::string reconstructURL(const httplib::Request& req,
                                      const HeaderMap& headers);
    // The X-OBAuth-* headers describing a decision to the upstream.
    static httplib::Headers verificationHeaders(const Decision& decision);

private:
    void proxyUpstream(const httplib::Request& req, const Decision& decision,
                       httplib::Response& res) const;

    const SidecarConfig config;
    std::unique_ptr<DecisionEngine> engine;
    httplib::Server server;
    std::thread server_thread;
    // scheme://host[:port] of the upstream.
    std::string upstream_origin;
    // host[:port] of the upstream, for the Host header.
    std::string upstream_host;
};
