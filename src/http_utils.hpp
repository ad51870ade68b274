#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace http_utils
{
// Make an untrusted value safe for a header: every run of CR/LF becomes one
// space, surrounding whitespace is trimmed, and the result is clamped to
// `max_length` characters.
std::string sanitizeHeaderValue(std::string_view value,
                                size_t max_length = 200);

// Connection-level headers that a proxy must not pass along.
bool isHopByHopHeader(std::string_view name);

// Whether `path` is `prefix`, below it ("/prefix/..."), or a file next to it
// ("/prefix.html"). A trailing slash on the prefix is ignored, and
// "/prefixed" does not match "/prefix".
bool matchesProtectedPrefix(std::string_view path, std::string_view prefix);
bool isProtectedPath(std::string_view path,
                     const std::vector<std::string>& prefixes);
} // namespace http_utils
