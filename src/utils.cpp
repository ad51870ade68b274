#include "utils.hpp"

#include <cctype>

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view lstrip(std::string_view s)
{
    size_t begin = 0;
    while(begin < s.size() && isSpace(s[begin]))
    {
        begin++;
    }
    return s.substr(begin);
}

std::string_view rstrip(std::string_view s)
{
    size_t end = s.size();
    while(end > 0 && isSpace(s[end - 1]))
    {
        end--;
    }
    return s.substr(0, end);
}

std::string_view strip(std::string_view s)
{
    return rstrip(lstrip(s));
}

std::vector<std::string> split(std::string_view s, char delim)
{
    std::vector<std::string> pieces;
    size_t begin = 0;
    while(true)
    {
        size_t pos = s.find(delim, begin);
        if(pos == std::string_view::npos)
        {
            pieces.emplace_back(s.substr(begin));
            break;
        }
        pieces.emplace_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return pieces;
}
