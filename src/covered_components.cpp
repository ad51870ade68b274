#include "covered_components.hpp"

#include <mw/utils.hpp>

#include "utils.hpp"

std::vector<std::string> parseCoveredComponents(std::string_view signature_input)
{
    std::vector<std::string> components;
    size_t open = signature_input.find('(');
    if(open == std::string_view::npos)
    {
        return components;
    }
    size_t close = signature_input.find(')', open);
    if(close == std::string_view::npos)
    {
        return components;
    }

    std::string_view content = signature_input.substr(open + 1,
                                                      close - open - 1);
    size_t begin = 0;
    while(begin < content.size())
    {
        size_t end = begin;
        while(end < content.size() && !isSpace(content[end]))
        {
            end++;
        }
        std::string_view token = content.substr(begin, end - begin);
        begin = end + 1;

        if(token.size() >= 2 && token.front() == '"' && token.back() == '"')
        {
            token = token.substr(1, token.size() - 2);
        }
        if(token.empty())
        {
            continue;
        }
        std::string component(token);
        mw::toLower(component);
        components.push_back(std::move(component));
    }
    return components;
}
