#include "types.hpp"

#include <algorithm>
#include <cctype>

bool CaseInsensitiveLess::operator()(std::string_view a,
                                     std::string_view b) const
{
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y)
        {
            return std::tolower(x) < std::tolower(y);
        });
}

bool methodCarriesBody(std::string_view method)
{
    CaseInsensitiveLess less;
    auto equals = [&](std::string_view m)
    {
        return !less(method, m) && !less(m, method);
    };
    return equals("POST") || equals("PUT") || equals("PATCH");
}

VerificationRequest VerificationRequest::fromView(const RequestView& view)
{
    VerificationRequest req;
    req.method = view.method;
    req.url = view.url;
    req.headers = view.headers;
    if(view.body.has_value())
    {
        req.body = std::string(*view.body);
    }
    return req;
}

RequestView VerificationRequest::view() const
{
    std::optional<std::string_view> body_view;
    if(body.has_value())
    {
        body_view = *body;
    }
    return RequestView{headers, method, url, body_view};
}
