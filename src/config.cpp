#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <mw/url.hpp>
#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support
#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace
{

mw::E<std::string> readFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        return std::unexpected(mw::runtimeError(
            "Cannot open config file: " + path));
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

mw::E<int64_t> parseInt(std::string_view name, std::string_view s)
{
    int64_t value = 0;
    s = strip(s);
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if(ec != std::errc() || ptr != s.data() + s.size())
    {
        return std::unexpected(mw::runtimeError(
            std::string("Invalid integer for ") + std::string(name) + ": " +
            std::string(s)));
    }
    return value;
}

const char* env(const char* name)
{
    const char* value = std::getenv(name);
    if(value == nullptr || *value == '\0')
    {
        return nullptr;
    }
    return value;
}

} // namespace

mw::E<EnforcementMode> parseMode(std::string_view s)
{
    if(s == "observe")
    {
        return EnforcementMode::OBSERVE;
    }
    if(s == "require" || s == "require-verified")
    {
        return EnforcementMode::REQUIRE;
    }
    return std::unexpected(mw::runtimeError(
        "Invalid mode: " + std::string(s) +
        ". Must be 'observe' or 'require'"));
}

std::string_view modeStr(EnforcementMode mode)
{
    switch(mode)
    {
    case EnforcementMode::OBSERVE:
        return "observe";
    case EnforcementMode::REQUIRE:
        return "require";
    }
    return "observe";
}

mw::E<void> EnforcementConfig::validate() const
{
    auto url = mw::URL::fromStr(verifier_url);
    if(!url.has_value() || url->host().empty())
    {
        return std::unexpected(mw::runtimeError(
            "Invalid verifier URL: " + verifier_url));
    }
    if(timeout.count() <= 0)
    {
        return std::unexpected(mw::runtimeError(
            "Verifier timeout must be positive"));
    }
    return {};
}

std::vector<std::string> parsePathList(std::string_view s)
{
    std::vector<std::string> paths;
    for(const std::string& piece : split(s, ','))
    {
        std::string_view path = strip(piece);
        if(!path.empty())
        {
            paths.emplace_back(path);
        }
    }
    return paths;
}

mw::E<void> SidecarConfig::loadYAML(const std::string& path)
{
    ASSIGN_OR_RETURN(std::string content, readFile(path));
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::NodeRef root = tree.rootref();

    if(root.has_child("listen_address")) root["listen_address"] >> listen_address;
    if(root.has_child("port")) root["port"] >> port;
    if(root.has_child("upstream_url")) root["upstream_url"] >> upstream_url;
    if(root.has_child("log_level")) root["log_level"] >> log_level;
    if(root.has_child("protected_paths"))
    {
        protected_paths.clear();
        for(ryml::NodeRef child : root["protected_paths"].children())
        {
            std::string p;
            child >> p;
            if(!p.empty())
            {
                protected_paths.push_back(std::move(p));
            }
        }
    }

    if(root.has_child("enforcement"))
    {
        auto node = root["enforcement"];
        if(node.has_child("verifier_url"))
        {
            node["verifier_url"] >> enforcement.verifier_url;
        }
        if(node.has_child("mode"))
        {
            std::string mode;
            node["mode"] >> mode;
            ASSIGN_OR_RETURN(enforcement.mode, parseMode(mode));
        }
        if(node.has_child("timeout_ms"))
        {
            int64_t ms = 0;
            node["timeout_ms"] >> ms;
            enforcement.timeout = std::chrono::milliseconds(ms);
        }
    }
    spdlog::debug("Loaded config from {}.", path);
    return {};
}

mw::E<void> SidecarConfig::loadEnv()
{
    if(const char* value = env("PORT"))
    {
        ASSIGN_OR_RETURN(int64_t p, parseInt("PORT", value));
        port = static_cast<int>(p);
    }
    if(const char* value = env("UPSTREAM_URL"))
    {
        upstream_url = value;
    }
    if(const char* value = env("OBA_VERIFIER_URL"))
    {
        enforcement.verifier_url = value;
    }
    if(const char* value = env("OBA_MODE"))
    {
        ASSIGN_OR_RETURN(enforcement.mode, parseMode(value));
    }
    if(const char* value = env("OBA_TIMEOUT_MS"))
    {
        ASSIGN_OR_RETURN(int64_t ms, parseInt("OBA_TIMEOUT_MS", value));
        enforcement.timeout = std::chrono::milliseconds(ms);
    }
    if(const char* value = env("OBA_PROTECTED_PATHS"))
    {
        protected_paths = parsePathList(value);
    }
    return {};
}

mw::E<void> SidecarConfig::validate() const
{
    DO_OR_RETURN(enforcement.validate());
    auto url = mw::URL::fromStr(upstream_url);
    if(!url.has_value() || url->host().empty())
    {
        return std::unexpected(mw::runtimeError(
            "Invalid upstream URL: " + upstream_url));
    }
    if(port <= 0 || port > 65535)
    {
        return std::unexpected(mw::runtimeError(
            "Invalid port: " + std::to_string(port)));
    }
    return {};
}
