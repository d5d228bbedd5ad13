#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <toml++/toml.h>

namespace translate
{
    class HttpTransport;

    enum class Backend
    {
        OpenAI = 0,
        Dashscope = 1
    };

    enum class ErrorKind
    {
        None = 0,
        Configuration,     // translator not initialised or missing settings
        Transport,         // provider could not be reached
        Cancelled,         // caller raised the cancel flag
        Provider,          // non-2xx HTTP status
        MalformedResponse  // 2xx body without choices[0].message.content
    };

    const char* errorKindName(ErrorKind kind);

    std::optional<Backend> backendFromString(const std::string& name);
    const char* backendName(Backend backend);

    struct BackendConfig
    {
        Backend backend = Backend::OpenAI;
        std::string api_key;
        std::string base_url;
        std::string model;
        std::string source_lang;
        std::string target_lang;
        bool translation_options = false;
        int connect_timeout_ms = 5000;
        int timeout_ms = 45000;

        // Reads the [translator] section. Unknown backend names yield std::nullopt and set error.
        static std::optional<BackendConfig> fromToml(const toml::table& section, std::string& error);
    };

    struct TranslationResult
    {
        bool ok = false;
        std::string text;
        ErrorKind error = ErrorKind::None;
        int status_code = 0;
        std::string response_body;
        std::string error_message;
    };

    class ITranslator
    {
    public:
        virtual ~ITranslator() = default;
        virtual bool init(const BackendConfig& cfg) = 0;
        virtual bool isReady() const = 0;
        virtual void shutdown() = 0;
        // Blocking. Empty text succeeds with empty output and never touches the network.
        virtual TranslationResult translate(const std::string& text, const std::string& dst_lang,
                                            const std::atomic<bool>* cancel_flag) = 0;
        virtual const char* providerName() const = 0;
        virtual const char* lastError() const = 0;
    };

    // Factory function to create translators based on backend type.
    // A null transport selects the cpr-backed default.
    std::unique_ptr<ITranslator> createTranslator(Backend backend, std::unique_ptr<HttpTransport> transport = nullptr);
}
