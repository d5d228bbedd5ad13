#pragma once

#include "ILLMTranslator.hpp"

namespace translate
{

// Alibaba Dashscope compatible-mode endpoint. The source language is fixed
// by configuration; the user message carries the raw text only.
class DashscopeTranslator : public ILLMTranslator
{
public:
    explicit DashscopeTranslator(std::unique_ptr<HttpTransport> transport = nullptr);
    ~DashscopeTranslator() override = default;

    const char* providerName() const override;

    static constexpr const char* kDefaultSourceLang = "Chinese";

protected:
    std::string defaultModel() const override;
    Prompt buildPrompt(const Job& job) const override;
    void buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const override;

private:
    std::string sourceLang() const;
};

} // namespace translate
