#pragma once

#include "ILLMTranslator.hpp"

namespace translate
{

// Generic OpenAI-compatible chat completion endpoint.
class OpenAITranslator : public ILLMTranslator
{
public:
    explicit OpenAITranslator(std::unique_ptr<HttpTransport> transport = nullptr);
    ~OpenAITranslator() override = default;

    const char* providerName() const override;

    static std::string normalizeURL(const std::string& base_url);

protected:
    std::string defaultModel() const override;
    Prompt buildPrompt(const Job& job) const override;
    std::string buildUrl(const Job& job) const override;
};

} // namespace translate
