#pragma once

#include <string>
#include <string_view>
#include <vector>

bool isSpace(char c);

std::string_view lstrip(std::string_view s);
std::string_view rstrip(std::string_view s);
std::string_view strip(std::string_view s);

// Split `s` at every `delim`. Empty pieces are kept.
std::vector<std::string> split(std::string_view s, char delim);
