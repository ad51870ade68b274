#pragma once

#include <string>
#include <string_view>
#include <vector>

// Extract the covered components from a Signature-Input value such as
//
//     sig1=("@method" "@target-uri" "content-type");created=1700000000
//
// Only the first parenthesized list is read. Tokens are unquoted and
// lowercased; order and duplicates are kept. A value with no list, an
// unterminated list, or an empty list yields no components. Parameters after
// the list (created, keyid, alg...) are not interpreted.
std::vector<std::string> parseCoveredComponents(std::string_view signature_input);

// Derived components ("@method", "@authority"...) name request properties,
// not headers.
inline bool isDerivedComponent(std::string_view component)
{
    return component.starts_with('@');
}
