#include "ITranslator.hpp"

#include <algorithm>
#include <cctype>

namespace translate
{

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string default_url(Backend backend)
{
    switch (backend)
    {
    case Backend::OpenAI:
        return "https://api.openai.com/v1/chat/completions";
    case Backend::Dashscope:
        return "https://dashscope.aliyuncs.com/compatible-mode/v1/chat/completions";
    }
    return {};
}

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Provider:
        return "provider";
    case ErrorKind::MalformedResponse:
        return "malformed response";
    }
    return "unknown";
}

std::optional<Backend> backendFromString(const std::string& name)
{
    const auto lower = to_lower(name);
    if (lower.empty() || lower == "openai")
        return Backend::OpenAI;
    if (lower == "dashscope" || lower == "qwen")
        return Backend::Dashscope;
    return std::nullopt;
}

const char* backendName(Backend backend)
{
    switch (backend)
    {
    case Backend::OpenAI:
        return "openai";
    case Backend::Dashscope:
        return "dashscope";
    }
    return "unknown";
}

std::optional<BackendConfig> BackendConfig::fromToml(const toml::table& section, std::string& error)
{
    BackendConfig out;

    const auto backend_str = section["backend"].value_or(std::string("openai"));
    auto backend = backendFromString(backend_str);
    if (!backend)
    {
        error = "Unknown translator backend '" + backend_str + "'";
        return std::nullopt;
    }
    out.backend = *backend;

    out.api_key = section["api_key"].value_or(std::string());
    out.base_url = section["api_url"].value_or(std::string());
    if (out.base_url.empty())
        out.base_url = default_url(out.backend);
    out.model = section["model"].value_or(std::string());
    out.source_lang = section["source_lang"].value_or(std::string());
    out.target_lang = section["target_lang"].value_or(std::string());
    out.translation_options = section["translation_options"].value_or(false);

    if (auto v = section["connect_timeout_ms"].value<int64_t>())
        out.connect_timeout_ms = *v <= 0 ? out.connect_timeout_ms : static_cast<int>(*v);
    if (auto v = section["timeout_ms"].value<int64_t>())
        out.timeout_ms = *v <= 0 ? out.timeout_ms : static_cast<int>(*v);

    return out;
}

} // namespace translate
