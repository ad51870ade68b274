#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

struct CaseInsensitiveLess
{
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const;
};

// Request headers as received from the host. Lookup ignores the case of the
// header name.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// Headers cleared to leave the process, keyed by lowercase name.
using ForwardedHeaders = std::map<std::string, std::string>;

// True for methods whose request body is included in the verification
// envelope (POST, PUT, PATCH).
bool methodCarriesBody(std::string_view method);

// A non-owning description of one inbound request. The host keeps the
// referenced data alive for the duration of the evaluation.
struct RequestView
{
    const HeaderMap& headers;
    std::string_view method;
    std::string_view url;
    std::optional<std::string_view> body;
};

// Owning counterpart of RequestView, used when the evaluation outlives the
// caller's buffers.
struct VerificationRequest
{
    std::string method;
    std::string url;
    HeaderMap headers;
    std::optional<std::string> body;

    static VerificationRequest fromView(const RequestView& view);
    RequestView view() const;
};
