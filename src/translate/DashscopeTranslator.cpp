#include "DashscopeTranslator.hpp"

#include <nlohmann/json.hpp>

namespace translate
{

DashscopeTranslator::DashscopeTranslator(std::unique_ptr<HttpTransport> transport)
    : ILLMTranslator(std::move(transport))
{
}

const char* DashscopeTranslator::providerName() const { return "Dashscope"; }

std::string DashscopeTranslator::defaultModel() const { return "qwen-plus"; }

std::string DashscopeTranslator::sourceLang() const
{
    return config().source_lang.empty() ? std::string(kDefaultSourceLang) : config().source_lang;
}

ILLMTranslator::Prompt DashscopeTranslator::buildPrompt(const Job& job) const
{
    std::string system_prompt = "You are a master translator. Translate the user's input from {source_lang} into "
                                "{target_lang}. Return only the translated content, nothing else.";
    replaceAll(system_prompt, "{source_lang}", sourceLang());
    replaceAll(system_prompt, "{target_lang}", job.dst);

    Prompt prompt;
    prompt.messages.push_back({ Role::System, std::move(system_prompt) });
    prompt.messages.push_back({ Role::User, job.text });
    return prompt;
}

void DashscopeTranslator::buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const
{
    ILLMTranslator::buildRequestBody(job, prompt, body);
    if (config().translation_options)
    {
        body["translation_options"] = {
            { "source_lang", sourceLang() },
            { "target_lang", job.dst      }
        };
    }
}

} // namespace translate
