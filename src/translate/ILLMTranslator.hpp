#pragma once

#include "ITranslator.hpp"

#include "TranslatorHelpers.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace translate
{

// Shared request/response plumbing for chat-completion style providers.
// Subclasses describe the wire shape; this class owns the transport and the
// error classification.
class ILLMTranslator : public ITranslator
{
public:
    explicit ILLMTranslator(std::unique_ptr<HttpTransport> transport = nullptr);
    ~ILLMTranslator() override;

    bool init(const BackendConfig& cfg) override;
    bool isReady() const override;
    void shutdown() override;
    TranslationResult translate(const std::string& text, const std::string& dst_lang,
                                const std::atomic<bool>* cancel_flag) override;

    const char* lastError() const override { return last_error_.c_str(); }

protected:
    struct Job
    {
        std::string text;
        std::string dst;
    };

    enum class Role
    {
        System,
        User,
        Assistant
    };

    struct ChatMessage
    {
        Role role = Role::User;
        std::string content;
    };

    struct Prompt
    {
        std::vector<ChatMessage> messages;
    };

    struct ParseResult
    {
        bool ok = false;
        std::string error_message;
    };

    virtual std::string validateConfig(const BackendConfig& cfg) const;
    virtual std::string defaultModel() const = 0;
    virtual Prompt buildPrompt(const Job& job) const = 0;
    virtual void buildHeaders(const Job& job, std::vector<Header>& headers) const;
    virtual std::string buildUrl(const Job& job) const;
    virtual void buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const;
    virtual ParseResult parseResponse(const Job& job, const HttpResponse& resp, std::string& out) const;
    virtual void configureSession(const Job& job, SessionConfig& cfg) const;

    static const char* roleName(Role role);
    static void replaceAll(std::string& target, const std::string& placeholder, const std::string& value);

    const BackendConfig& config() const { return cfg_; }

private:
    TranslationResult fail(ErrorKind kind, std::string message);

    BackendConfig cfg_{};
    bool initialized_ = false;
    std::string last_error_;
    std::unique_ptr<HttpTransport> transport_;
};

} // namespace translate
