#include "forwarding_policy.hpp"

#include <array>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "covered_components.hpp"

namespace
{

constexpr std::array<std::string_view, 4> SENSITIVE_HEADERS = {
    "cookie", "authorization", "proxy-authorization", "www-authenticate",
};

constexpr std::array<std::string_view, 3> SIGNATURE_HEADERS = {
    HEADER_SIGNATURE_INPUT, HEADER_SIGNATURE, HEADER_SIGNATURE_AGENT,
};

} // namespace

bool isSensitiveHeader(std::string_view lowercase_name)
{
    for(std::string_view name : SENSITIVE_HEADERS)
    {
        if(name == lowercase_name)
        {
            return true;
        }
    }
    return false;
}

bool isSigned(const HeaderMap& headers)
{
    for(std::string_view name : SIGNATURE_HEADERS)
    {
        if(headers.contains(name))
        {
            return true;
        }
    }
    return false;
}

mw::E<ForwardedHeaders> buildForwardSet(const HeaderMap& headers)
{
    std::vector<std::string> covered;
    if(auto it = headers.find(HEADER_SIGNATURE_INPUT); it != headers.end())
    {
        covered = parseCoveredComponents(it->second);
    }

    for(const std::string& component : covered)
    {
        if(!isDerivedComponent(component) && isSensitiveHeader(component))
        {
            spdlog::warn("Refusing to forward signed request: signature "
                         "covers sensitive header {}.", component);
            return std::unexpected(mw::runtimeError(
                "Signature covers sensitive header: " + component));
        }
    }

    ForwardedHeaders result;
    for(std::string_view name : SIGNATURE_HEADERS)
    {
        if(auto it = headers.find(name); it != headers.end())
        {
            result.emplace(name, it->second);
        }
    }
    for(const std::string& component : covered)
    {
        if(isDerivedComponent(component))
        {
            continue;
        }
        if(auto it = headers.find(component); it != headers.end())
        {
            result.emplace(component, it->second);
        }
    }
    return result;
}
