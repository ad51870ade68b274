#include "http_utils.hpp"

#include <array>

#include <mw/utils.hpp>

#include "utils.hpp"

namespace http_utils {

std::string sanitizeHeaderValue(std::string_view value, size_t max_length)
{
    std::string result;
    result.reserve(value.size());
    bool in_newline = false;
    for(char c : value)
    {
        if(c == '\r' || c == '\n')
        {
            if(!in_newline)
            {
                result += ' ';
            }
            in_newline = true;
            continue;
        }
        in_newline = false;
        result += c;
    }
    std::string stripped(strip(result));
    if(stripped.size() > max_length)
    {
        stripped.resize(max_length);
    }
    return stripped;
}

bool isHopByHopHeader(std::string_view name)
{
    static constexpr std::array<std::string_view, 8> HOP_BY_HOP = {
        "connection", "keep-alive", "proxy-authenticate",
        "proxy-authorization", "te", "trailer", "transfer-encoding",
        "upgrade",
    };
    std::string lower(name);
    mw::toLower(lower);
    for(std::string_view h : HOP_BY_HOP)
    {
        if(h == lower)
        {
            return true;
        }
    }
    return false;
}

bool matchesProtectedPrefix(std::string_view path, std::string_view prefix)
{
    if(prefix.ends_with('/'))
    {
        prefix.remove_suffix(1);
    }
    // "/" normalizes to "", which matches every absolute path.
    if(prefix.empty())
    {
        return path.starts_with('/');
    }
    if(path == prefix)
    {
        return true;
    }
    if(!path.starts_with(prefix))
    {
        return false;
    }
    char next = path[prefix.size()];
    return next == '/' || next == '.';
}

bool isProtectedPath(std::string_view path,
                     const std::vector<std::string>& prefixes)
{
    for(const std::string& prefix : prefixes)
    {
        if(matchesProtectedPrefix(path, prefix))
        {
            return true;
        }
    }
    return false;
}

}
