#include "../utils/HttpCommon.hpp"
#include "TranslatorHelpers.hpp"

#include <cpr/cpr.h>
#include <cctype>

namespace
{

inline bool is_content_type(const std::string& name)
{
    const char* ct = "Content-Type";
    if (name.size() != 12)
        return false;
    for (size_t i = 0; i < 12; ++i)
    {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(ct[i])));
        if (a != b)
            return false;
    }
    return true;
}

inline cpr::Header make_header(const std::vector<translate::Header>& headers, bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    for (auto& kv : headers)
    {
        if (!has_ct && is_content_type(kv.name))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

inline void apply_common(cpr::Session& s, const translate::SessionConfig& cfg)
{
    int timeout_ms = cfg.timeout_ms;
    if (cfg.use_adaptive_timeout && cfg.text_length_hint > 0)
        timeout_ms = translate::helpers::calculate_adaptive_timeout(cfg.timeout_ms, cfg.text_length_hint);

    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ timeout_ms });
    // The session is reused, so the callback is always replaced. A null flag never aborts.
    s.SetProgressCallback(cpr::ProgressCallback(
        [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool {
            auto flag = reinterpret_cast<const std::atomic<bool>*>(userdata);
            return !flag || !flag->load();
        },
        reinterpret_cast<intptr_t>(cfg.cancel_flag)));
}

} // namespace

namespace translate
{

struct CprTransport::Impl
{
    cpr::Session session;
};

CprTransport::CprTransport()
    : impl_(std::make_unique<Impl>())
{
}

CprTransport::~CprTransport() = default;

HttpResponse CprTransport::postJson(const std::string& url, const std::string& body,
                                    const std::vector<Header>& headers, const SessionConfig& cfg)
{
    HttpResponse hr;
    if (cfg.cancel_flag && cfg.cancel_flag->load())
    {
        hr.cancelled = true;
        hr.error = "request cancelled";
        return hr;
    }

    auto& s = impl_->session;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    auto r = s.Post();

    const bool aborted = r.error.code == cpr::ErrorCode::ABORTED_BY_CALLBACK;
    std::string transport_error;
    if (r.error)
        transport_error = r.error.message.empty() ? std::string("transport error") : r.error.message;
    return finishResponse(static_cast<int>(r.status_code), std::move(r.text), std::move(transport_error), aborted);
}

HttpResponse finishResponse(int status_code, std::string text, std::string transport_error, bool aborted)
{
    HttpResponse hr;
    if (aborted)
    {
        hr.cancelled = true;
        hr.error = "request cancelled";
        return hr;
    }
    if (!transport_error.empty())
    {
        hr.error = std::move(transport_error);
        return hr;
    }
    hr.status_code = status_code;
    hr.text = std::move(text);
    return hr;
}

} // namespace translate
