#include "OpenAITranslator.hpp"

namespace translate
{

OpenAITranslator::OpenAITranslator(std::unique_ptr<HttpTransport> transport)
    : ILLMTranslator(std::move(transport))
{
}

const char* OpenAITranslator::providerName() const
{
    return "OpenAI";
}

std::string OpenAITranslator::defaultModel() const
{
    return "gpt-3.5-turbo";
}

ILLMTranslator::Prompt OpenAITranslator::buildPrompt(const Job& job) const
{
    std::string request = "Translate the following text to {target_lang}: {source_text}";
    replaceAll(request, "{target_lang}", job.dst);
    replaceAll(request, "{source_text}", job.text);

    Prompt prompt;
    prompt.messages.push_back({ Role::System, "You are a professional translator." });
    prompt.messages.push_back({ Role::User, std::move(request) });
    return prompt;
}

std::string OpenAITranslator::buildUrl(const Job& job) const
{
    (void)job;
    return normalizeURL(config().base_url);
}

std::string OpenAITranslator::normalizeURL(const std::string& base_url)
{
    std::string url = base_url;

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    if (url.empty())
        return url;

    size_t scheme_end = url.find("://");
    size_t path_start = (scheme_end != std::string::npos) ? url.find('/', scheme_end + 3) : url.find('/');

    if (path_start != std::string::npos)
    {
        std::string path = url.substr(path_start);
        if (path == "/v1")
            return url + "/chat/completions";
        return url;
    }

    return url + "/v1/chat/completions";
}

} // namespace translate
