#include "HttpCommon.hpp"
#include "TranslatorHelpers.hpp"

#include <cpr/cpr.h>
#include <cctype>

namespace
{

void apply_common(cpr::Session& s, const transcache::http::SessionConfig& cfg)
{
    int timeout_ms = cfg.timeout_ms;
    if (cfg.use_adaptive_timeout)
        timeout_ms = transcache::helpers::calculate_adaptive_timeout(cfg.timeout_ms, cfg.text_length_hint);

    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ timeout_ms });
    if (cfg.keep_running)
    {
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool {
                auto flag = reinterpret_cast<const std::atomic<bool>*>(userdata);
                return flag && flag->load();
            },
            reinterpret_cast<intptr_t>(cfg.keep_running)));
    }
}

bool is_content_type(const std::string& name)
{
    static const char* ct = "content-type";
    if (name.size() != 12)
        return false;
    for (std::size_t i = 0; i < 12; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(name[i])) != ct[i])
            return false;
    }
    return true;
}

cpr::Header make_header(const std::vector<transcache::http::Header>& headers, bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    for (const auto& kv : headers)
    {
        if (!has_ct && is_content_type(kv.name))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

transcache::http::HttpResponse to_response(cpr::Response&& r)
{
    transcache::http::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace

namespace transcache::http
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

std::string url_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace transcache::http
