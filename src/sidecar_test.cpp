#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "decision_engine.hpp"
#include "sidecar.hpp"
#include "verifier_gateway.hpp"
#include "verifier_transport_mock.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

// A minimal origin server that records the last request it saw.
class FakeUpstream
{
public:
    FakeUpstream()
    {
        server.Get(".*", [this](const httplib::Request& req,
                                httplib::Response& res)
        {
            record(req);
            res.set_header("X-Upstream", "yes");
            res.set_content("hello from upstream", "text/plain");
        });
        server.Post(".*", [this](const httplib::Request& req,
                                 httplib::Response& res)
        {
            record(req);
            res.status = 201;
            res.set_content(req.body, "application/octet-stream");
        });
    }

    ~FakeUpstream()
    {
        server.stop();
        if(thread.joinable())
        {
            thread.join();
        }
    }

    bool start(int port)
    {
        if(!server.bind_to_port("127.0.0.1", port))
        {
            return false;
        }
        thread = std::thread([this]() { server.listen_after_bind(); });
        server.wait_until_ready();
        return true;
    }

    httplib::Headers lastHeaders()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return last_headers;
    }

    std::string lastHeader(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = last_headers.find(name);
        return it == last_headers.end() ? "" : it->second;
    }

    int hits()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return count;
    }

private:
    void record(const httplib::Request& req)
    {
        std::lock_guard<std::mutex> lock(mutex);
        last_headers = req.headers;
        count++;
    }

    httplib::Server server;
    std::thread thread;
    std::mutex mutex;
    httplib::Headers last_headers;
    int count = 0;
};

class SidecarTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        conf.listen_address = "127.0.0.1";
        conf.port = 18088;
        conf.upstream_url = "http://127.0.0.1:18089";
        conf.protected_paths = {"/protected"};
        conf.enforcement.verifier_url = "http://127.0.0.1:18090/verify";
    }

    std::unique_ptr<Sidecar> makeSidecar(EnforcementMode mode)
    {
        conf.enforcement.mode = mode;
        auto t = std::make_unique<NiceMock<VerifierTransportMock>>();
        transport = t.get();
        auto engine = std::make_unique<DecisionEngine>(
            conf.enforcement,
            std::make_unique<VerifierGateway>(std::move(t)));
        return std::make_unique<Sidecar>(conf, std::move(engine));
    }

    httplib::Headers signedHeaders() const
    {
        return {
            {"Signature-Input",
             R"x(sig1=("@method" "@path" "@authority");created=1700000000)x"},
            {"Signature", "sig1=:c2lnbmF0dXJl:"},
            {"Signature-Agent", "https://bot.example.com"},
        };
    }

    SidecarConfig conf;
    VerifierTransportMock* transport = nullptr;
};

TEST_F(SidecarTest, Health)
{
    auto sidecar = makeSidecar(EnforcementMode::REQUIRE);
    auto start_res = sidecar->start();
    ASSERT_TRUE(start_res) << "Failed to start sidecar: "
                           << mw::errorMsg(start_res.error());

    {
        httplib::Client client("http://127.0.0.1:18088");
        auto res = client.Get("/.well-known/health");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        auto data = nlohmann::json::parse(res->body);
        EXPECT_EQ(data["status"], "ok");
        EXPECT_EQ(data["service"], "sigwarden");
        EXPECT_EQ(data["upstream"], "http://127.0.0.1:18089");
        EXPECT_EQ(data["verifier"], "http://127.0.0.1:18090/verify");
        EXPECT_EQ(data["mode"], "require");
    }

    sidecar->stop();
    sidecar->wait();
}

TEST_F(SidecarTest, UnsignedRequestPassesThrough)
{
    FakeUpstream upstream;
    ASSERT_TRUE(upstream.start(18089));
    auto sidecar = makeSidecar(EnforcementMode::OBSERVE);
    EXPECT_CALL(*transport, postJSON(_)).Times(0);
    ASSERT_TRUE(sidecar->start());

    {
        httplib::Client client("http://127.0.0.1:18088");
        // A client cannot vouch for itself.
        auto res = client.Get("/public/page?x=1",
                              {{"X-OBAuth-Verified", "true"}});
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        EXPECT_EQ(res->body, "hello from upstream");
        EXPECT_EQ(res->get_header_value("X-Upstream"), "yes");
        EXPECT_EQ(res->get_header_value("X-OBAuth-Verified"), "false");
        EXPECT_EQ(res->get_header_value("X-OBA-Decision"), "observe");
    }
    EXPECT_EQ(upstream.hits(), 1);
    EXPECT_EQ(upstream.lastHeader("X-OBAuth-Verified"), "false");
    EXPECT_EQ(upstream.lastHeader("Host"), "127.0.0.1:18089");
    EXPECT_EQ(upstream.lastHeader("X-Forwarded-For"), "127.0.0.1");
    EXPECT_EQ(upstream.lastHeader("X-Forwarded-Proto"), "http");

    sidecar->stop();
    sidecar->wait();
}

TEST_F(SidecarTest, RequireModeDeniesUnsignedOnProtectedPath)
{
    FakeUpstream upstream;
    ASSERT_TRUE(upstream.start(18089));
    auto sidecar = makeSidecar(EnforcementMode::REQUIRE);
    ASSERT_TRUE(sidecar->start());

    {
        httplib::Client client("http://127.0.0.1:18088");
        auto res = client.Get("/protected/data");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 401);
        EXPECT_THAT(res->body, HasSubstr("Missing OpenBotAuth signature headers"));
        EXPECT_EQ(res->get_header_value("X-OBA-Decision"), "deny");

        // Outside the protected prefixes the request is only observed.
        res = client.Get("/open");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        EXPECT_EQ(res->get_header_value("X-OBA-Decision"), "observe");
    }
    EXPECT_EQ(upstream.hits(), 1);

    sidecar->stop();
    sidecar->wait();
}

TEST_F(SidecarTest, RequireModeDeniesInvalidSignature)
{
    FakeUpstream upstream;
    ASSERT_TRUE(upstream.start(18089));
    auto sidecar = makeSidecar(EnforcementMode::REQUIRE);
    EXPECT_CALL(*transport, postJSON(_))
        .WillOnce(Return(TransportReply{
            401, R"({"verified": false, "error": "Invalid signature"})"}));
    ASSERT_TRUE(sidecar->start());

    {
        httplib::Client client("http://127.0.0.1:18088");
        auto res = client.Get("/protected", signedHeaders());
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 401);
        EXPECT_EQ(nlohmann::json::parse(res->body)["error"],
                  "Invalid signature");
        EXPECT_EQ(res->get_header_value("X-OBAuth-Verified"), "false");
        EXPECT_EQ(res->get_header_value("X-OBAuth-Error"), "Invalid signature");
        EXPECT_EQ(res->get_header_value("X-OBA-Decision"), "deny");
    }
    EXPECT_EQ(upstream.hits(), 0);

    sidecar->stop();
    sidecar->wait();
}

TEST_F(SidecarTest, VerifiedRequestCarriesAgentUpstream)
{
    FakeUpstream upstream;
    ASSERT_TRUE(upstream.start(18089));
    auto sidecar = makeSidecar(EnforcementMode::REQUIRE);
    std::string envelope;
    EXPECT_CALL(*transport, postJSON(_))
        .WillOnce([&](const std::string& payload) -> mw::E<TransportReply>
        {
            envelope = payload;
            return TransportReply{200, R"({
                "verified": true,
                "agent": {
                    "client_name": "ExampleBot",
                    "jwks_url": "https://bot.example.com/jwks.json",
                    "kid": "key-123"
                }
            })"};
        });
    ASSERT_TRUE(sidecar->start());

    {
        httplib::Client client("http://127.0.0.1:18088");
        auto res = client.Post("/protected/upload", signedHeaders(),
                               "payload", "text/plain");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 201);
        EXPECT_EQ(res->body, "payload");
        EXPECT_EQ(res->get_header_value("X-OBAuth-Verified"), "true");
        EXPECT_EQ(res->get_header_value("X-OBAuth-Agent"), "ExampleBot");
        EXPECT_FALSE(res->has_header("X-OBAuth-Kid"));
        EXPECT_EQ(res->get_header_value("X-OBA-Decision"), "allow");
    }
    EXPECT_EQ(upstream.lastHeader("X-OBAuth-Verified"), "true");
    EXPECT_EQ(upstream.lastHeader("X-OBAuth-Agent"), "ExampleBot");
    EXPECT_EQ(upstream.lastHeader("X-OBAuth-JWKS-URL"),
              "https://bot.example.com/jwks.json");
    EXPECT_EQ(upstream.lastHeader("X-OBAuth-Kid"), "key-123");

    auto data = nlohmann::json::parse(envelope);
    EXPECT_EQ(data["method"], "POST");
    EXPECT_EQ(data["url"], "http://127.0.0.1:18088/protected/upload");
    EXPECT_EQ(data["body"], "payload");
    EXPECT_TRUE(data["headers"].contains("signature-input"));
    EXPECT_TRUE(data["headers"].contains("signature-agent"));

    sidecar->stop();
    sidecar->wait();
}

TEST_F(SidecarTest, UpstreamDownIsBadGateway)
{
    auto sidecar = makeSidecar(EnforcementMode::OBSERVE);
    ASSERT_TRUE(sidecar->start());

    {
        httplib::Client client("http://127.0.0.1:18088");
        auto res = client.Get("/anything");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 502);
        auto data = nlohmann::json::parse(res->body);
        EXPECT_EQ(data["error"], "Bad Gateway");
        EXPECT_TRUE(data.contains("message"));
    }

    sidecar->stop();
    sidecar->wait();
}

TEST_F(SidecarTest, StartFailsWithBadUpstream)
{
    conf.upstream_url = "not a url";
    auto sidecar = makeSidecar(EnforcementMode::OBSERVE);
    EXPECT_FALSE(sidecar->start().has_value());
}

TEST(SidecarHelpersTest, CollectHeadersJoinsRepeats)
{
    httplib::Request req;
    req.headers.emplace("Accept", "text/html");
    req.headers.emplace("accept", "application/json");
    req.headers.emplace("REMOTE_ADDR", "127.0.0.1");
    req.headers.emplace("Host", "example.com");

    HeaderMap headers = Sidecar::collectHeaders(req);
    EXPECT_EQ(headers.size(), 2);
    EXPECT_EQ(headers["ACCEPT"], "text/html, application/json");
    EXPECT_EQ(headers["host"], "example.com");
}

TEST(SidecarHelpersTest, ReconstructURL)
{
    httplib::Request req;
    req.path = "/a/b";
    req.target = "/a/b?c=d";

    HeaderMap headers = {{"Host", "example.com"}};
    EXPECT_EQ(Sidecar::reconstructURL(req, headers),
              "http://example.com/a/b?c=d");

    headers["X-Forwarded-Proto"] = "https";
    headers["X-Forwarded-Host"] = "public.example.com";
    EXPECT_EQ(Sidecar::reconstructURL(req, headers),
              "https://public.example.com/a/b?c=d");

    EXPECT_EQ(Sidecar::reconstructURL(httplib::Request(), HeaderMap()),
              "http://localhost/");
}

TEST(SidecarHelpersTest, VerificationHeadersSanitizeAgent)
{
    Decision decision;
    decision.state.is_signed = true;
    VerificationOutcome outcome;
    outcome.verified = true;
    outcome.status = VerificationOutcome::VERIFIED;
    outcome.agent = nlohmann::json{{"client_name", "Evil\r\nSet-Cookie: x"}};
    decision.state.result = outcome;

    httplib::Headers headers = Sidecar::verificationHeaders(decision);
    EXPECT_EQ(headers.find("X-OBAuth-Agent")->second, "Evil Set-Cookie: x");
    EXPECT_EQ(headers.find("X-OBAuth-Kid")->second, "");

    Decision unsigned_decision;
    headers = Sidecar::verificationHeaders(unsigned_decision);
    EXPECT_EQ(headers.size(), 1);
    EXPECT_EQ(headers.find("X-OBAuth-Verified")->second, "false");
}
