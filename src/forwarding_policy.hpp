#pragma once

#include <string_view>

#include <mw/error.hpp>

#include "types.hpp"

constexpr char HEADER_SIGNATURE_INPUT[] = "signature-input";
constexpr char HEADER_SIGNATURE[] = "signature";
constexpr char HEADER_SIGNATURE_AGENT[] = "signature-agent";

// Credential-bearing headers. These never leave the process, whether or not
// a signature covers them.
bool isSensitiveHeader(std::string_view lowercase_name);

// A request is signed iff any of signature-input, signature or
// signature-agent is present.
bool isSigned(const HeaderMap& headers);

// Select the headers that may be disclosed to the verifier: the signature
// headers that are present, plus every non-derived covered component found
// in `headers`. Covered components that are absent are skipped.
//
// Fails without producing anything if a covered component names a sensitive
// header. The whole covered list is checked before any value is copied.
mw::E<ForwardedHeaders> buildForwardSet(const HeaderMap& headers);
