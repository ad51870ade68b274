#include "sidecar.hpp"

#include <format>
#include <string_view>

#include <mw/url.hpp>
#include <mw/utils.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "http_utils.hpp"

namespace {

constexpr char CONTENT_TYPE_JSON[] = "application/json";
constexpr char SERVICE_NAME[] = "sigwarden";

// httplib records connection details as pseudo headers on the request.
bool isServerPseudoHeader(std::string_view name)
{
    return name == "REMOTE_ADDR" || name == "REMOTE_PORT" ||
        name == "LOCAL_ADDR" || name == "LOCAL_PORT";
}

std::string headerOr(const HeaderMap& headers, std::string_view name,
                     std::string_view fallback)
{
    if(auto it = headers.find(name); it != headers.end() && !it->second.empty())
    {
        return it->second;
    }
    return std::string(fallback);
}

std::string agentField(const nlohmann::json& agent, const char* key)
{
    if(auto it = agent.find(key); it != agent.end() && it->is_string())
    {
        return it->get<std::string>();
    }
    return "";
}

} // namespace

Sidecar::Sidecar(const SidecarConfig& conf,
                 std::unique_ptr<DecisionEngine> engine)
        : config(conf), engine(std::move(engine))
{
    mw::E<mw::URL> upstream = mw::URL::fromStr(config.upstream_url);
    size_t scheme_end = config.upstream_url.find("://");
    if(!upstream.has_value() || scheme_end == std::string::npos)
    {
        spdlog::error("Invalid upstream URL {}. Sidecar cannot start.",
                      config.upstream_url);
        return;
    }
    upstream_host = std::string(upstream->host());
    std::string port(upstream->port());
    if(!port.empty())
    {
        upstream_host += ":" + port;
    }
    upstream_origin = config.upstream_url.substr(0, scheme_end + 3) +
        upstream_host;
}

Sidecar::~Sidecar()
{
    stop();
    wait();
}

HeaderMap Sidecar::collectHeaders(const httplib::Request& req)
{
    HeaderMap headers;
    for(const auto& [key, value]: req.headers)
    {
        if(isServerPseudoHeader(key))
        {
            continue;
        }
        auto [it, inserted] = headers.emplace(key, value);
        if(!inserted)
        {
            it->second += ", " + value;
        }
    }
    return headers;
}

std::string Sidecar::reconstructURL(const httplib::Request& req,
                                    const HeaderMap& headers)
{
    std::string proto = headerOr(headers, "x-forwarded-proto", "http");
    std::string host = headerOr(headers, "x-forwarded-host",
                                headerOr(headers, "host", "localhost"));
    std::string target = req.target.empty() ? req.path : req.target;
    if(target.empty())
    {
        target = "/";
    }
    return std::format("{}://{}{}", proto, host, target);
}

httplib::Headers Sidecar::verificationHeaders(const Decision& decision)
{
    httplib::Headers headers;
    const std::optional<VerificationOutcome>& result = decision.state.result;
    if(result.has_value() && result->verified)
    {
        headers.emplace("X-OBAuth-Verified", "true");
        if(result->agent.has_value())
        {
            std::string name = agentField(*result->agent, "client_name");
            headers.emplace("X-OBAuth-Agent", http_utils::sanitizeHeaderValue(
                                name.empty() ? "unknown" : name));
            headers.emplace("X-OBAuth-JWKS-URL", http_utils::sanitizeHeaderValue(
                                agentField(*result->agent, "jwks_url")));
            headers.emplace("X-OBAuth-Kid", http_utils::sanitizeHeaderValue(
                                agentField(*result->agent, "kid")));
        }
        return headers;
    }

    headers.emplace("X-OBAuth-Verified", "false");
    if(result.has_value())
    {
        headers.emplace("X-OBAuth-Error", http_utils::sanitizeHeaderValue(
                            result->error.value_or("Verification failed")));
    }
    return headers;
}

void Sidecar::handleHealth(httplib::Response& res) const
{
    nlohmann::json data = {
        {"status", "ok"},
        {"service", SERVICE_NAME},
        {"upstream", config.upstream_url},
        {"verifier", engine->config().verifier_url},
        {"mode", std::string(modeStr(engine->config().mode))},
    };
    res.set_content(data.dump(), CONTENT_TYPE_JSON);
}

void Sidecar::handleRequest(const httplib::Request& req,
                            httplib::Response& res) const
{
    HeaderMap headers = collectHeaders(req);
    std::string url = reconstructURL(req, headers);
    std::optional<std::string_view> body;
    if(methodCarriesBody(req.method))
    {
        body = req.body;
    }
    RequestView view{headers, req.method, url, body};

    EnforcementMode mode = EnforcementMode::OBSERVE;
    if(engine->config().mode == EnforcementMode::REQUIRE &&
       http_utils::isProtectedPath(req.path, config.protected_paths))
    {
        mode = EnforcementMode::REQUIRE;
    }

    const Decision decision = engine->evaluate(view, mode);
    if(!decision.proceed())
    {
        res.status = decision.short_circuit->status;
        for(const auto& [key, value]: verificationHeaders(decision))
        {
            res.set_header(key, value);
        }
        res.set_header(DECISION_HEADER,
                       std::string(markerStr(Decision::DENY)));
        res.set_content(decision.short_circuit->body.dump(),
                        CONTENT_TYPE_JSON);
        return;
    }

    proxyUpstream(req, decision, res);
    res.set_header(DECISION_HEADER, std::string(markerStr(decision.marker)));
}

void Sidecar::proxyUpstream(const httplib::Request& req,
                            const Decision& decision,
                            httplib::Response& res) const
{
    const httplib::Headers obauth = verificationHeaders(decision);

    httplib::Request up;
    up.method = req.method;
    up.path = req.target.empty() ? req.path : req.target;
    for(const auto& [key, value]: req.headers)
    {
        std::string lower = key;
        mw::toLower(lower);
        if(http_utils::isHopByHopHeader(lower) || isServerPseudoHeader(key) ||
           lower == "host" || lower == "content-length" ||
           lower.starts_with("x-obauth-"))
        {
            continue;
        }
        up.headers.emplace(key, value);
    }
    for(const auto& [key, value]: obauth)
    {
        up.headers.emplace(key, value);
    }
    up.headers.emplace("Host", upstream_host);

    std::string forwarded_for = req.remote_addr.empty() ? "unknown"
        : req.remote_addr;
    if(req.has_header("X-Forwarded-For"))
    {
        up.headers.erase("X-Forwarded-For");
        forwarded_for = req.get_header_value("X-Forwarded-For") + ", " +
            forwarded_for;
    }
    up.headers.emplace("X-Forwarded-For", forwarded_for);
    if(!req.has_header("X-Forwarded-Proto"))
    {
        up.headers.emplace("X-Forwarded-Proto", "http");
    }
    if(!req.has_header("X-Forwarded-Host"))
    {
        up.headers.emplace("X-Forwarded-Host",
                           req.has_header("Host") ? req.get_header_value("Host")
                           : upstream_host);
    }
    up.body = req.body;

    httplib::Client client(upstream_origin);
    httplib::Result result = client.send(up);
    if(!result)
    {
        std::string msg = httplib::to_string(result.error());
        spdlog::error("Upstream request {} {} failed: {}", req.method,
                      up.path, msg);
        res.status = 502;
        nlohmann::json data = {{"error", "Bad Gateway"}, {"message", msg}};
        res.set_content(data.dump(), CONTENT_TYPE_JSON);
        return;
    }

    res.status = result->status;
    for(const auto& [key, value]: result->headers)
    {
        std::string lower = key;
        mw::toLower(lower);
        if(http_utils::isHopByHopHeader(lower) || lower == "content-length" ||
           lower == "content-type")
        {
            continue;
        }
        res.set_header(key, value);
    }
    for(const auto& [key, value]: obauth)
    {
        if(key != "X-OBAuth-JWKS-URL" && key != "X-OBAuth-Kid")
        {
            res.set_header(key, value);
        }
    }
    if(result->has_header("Content-Type"))
    {
        res.set_content(result->body, result->get_header_value("Content-Type"));
    }
    else
    {
        res.body = result->body;
    }
}

mw::E<void> Sidecar::start()
{
    if(upstream_origin.empty())
    {
        return std::unexpected(mw::runtimeError(
            "Invalid upstream URL: " + config.upstream_url));
    }

    server.Get("/.well-known/health", [this](const httplib::Request&,
                                             httplib::Response& res)
    {
        handleHealth(res);
    });

    auto proxy = [this](const httplib::Request& req, httplib::Response& res)
    {
        handleRequest(req, res);
    };
    server.Get(".*", proxy);
    server.Post(".*", proxy);
    server.Put(".*", proxy);
    server.Patch(".*", proxy);
    server.Delete(".*", proxy);
    server.Options(".*", proxy);

    if(!server.bind_to_port(config.listen_address, config.port))
    {
        return std::unexpected(mw::runtimeError(std::format(
            "Failed to bind to {}:{}", config.listen_address, config.port)));
    }
    server_thread = std::thread([this]() { server.listen_after_bind(); });
    server.wait_until_ready();

    spdlog::info("Listening at http://{}:{}/...", config.listen_address,
                 config.port);
    spdlog::info("Upstream: {}, verifier: {}, mode: {}", config.upstream_url,
                 engine->config().verifier_url,
                 modeStr(engine->config().mode));
    return {};
}

void Sidecar::stop()
{
    server.stop();
}

void Sidecar::wait()
{
    if(server_thread.joinable())
    {
        server_thread.join();
    }
}
