#include "utils/HttpCommon.hpp"

#include <cpr/cpr.h>

#include <cctype>
#include <utility>

namespace
{

void apply_common(cpr::Session& s, const translate::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
}

bool is_content_type(const std::string& name)
{
    static const char* ct = "content-type";
    if (name.size() != 12)
        return false;
    for (std::size_t i = 0; i < 12; ++i)
    {
        if (static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))) != ct[i])
            return false;
    }
    return true;
}

cpr::Header make_header(const std::vector<translate::Header>& headers, bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    for (const auto& kv : headers)
    {
        if (is_content_type(kv.name))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

translate::HttpResponse to_response(cpr::Response&& r)
{
    translate::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
        hr.timed_out = r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace

namespace translate
{

HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    return to_response(s.Post());
}

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ false));
    apply_common(s, cfg);
    return to_response(s.Get());
}

} // namespace translate
