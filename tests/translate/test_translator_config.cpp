#include <catch2/catch_test_macros.hpp>
#include <toml++/toml.h>
#include "translate/ITranslator.hpp"

using namespace translate;

TEST_CASE("Backend names", "[translate][config]") {
    REQUIRE(backendFromString("openai") == Backend::OpenAI);
    REQUIRE(backendFromString("OpenAI") == Backend::OpenAI);
    REQUIRE(backendFromString("") == Backend::OpenAI);
    REQUIRE(backendFromString("dashscope") == Backend::Dashscope);
    REQUIRE(backendFromString("Qwen") == Backend::Dashscope);
    REQUIRE_FALSE(backendFromString("google").has_value());

    REQUIRE(std::string(backendName(Backend::OpenAI)) == "openai");
    REQUIRE(std::string(backendName(Backend::Dashscope)) == "dashscope");
    REQUIRE(std::string(errorKindName(ErrorKind::MalformedResponse)) == "malformed response");
}

TEST_CASE("BackendConfig from TOML", "[translate][config]") {
    std::string error;

    SECTION("Empty section uses OpenAI defaults") {
        toml::table section;
        auto config = BackendConfig::fromToml(section, error);
        REQUIRE(config.has_value());
        REQUIRE(config->backend == Backend::OpenAI);
        REQUIRE(config->base_url == "https://api.openai.com/v1/chat/completions");
        REQUIRE(config->api_key.empty());
        REQUIRE(config->connect_timeout_ms == 5000);
        REQUIRE(config->timeout_ms == 45000);
        REQUIRE_FALSE(config->translation_options);
    }

    SECTION("Dashscope section") {
        auto section = toml::parse(R"(
            backend = "dashscope"
            api_key = "sk-1"
            source_lang = "Japanese"
            target_lang = "English"
            translation_options = true
            timeout_ms = 60000
        )");
        auto config = BackendConfig::fromToml(section, error);
        REQUIRE(config.has_value());
        REQUIRE(config->backend == Backend::Dashscope);
        REQUIRE(config->api_key == "sk-1");
        REQUIRE(config->base_url == "https://dashscope.aliyuncs.com/compatible-mode/v1/chat/completions");
        REQUIRE(config->source_lang == "Japanese");
        REQUIRE(config->target_lang == "English");
        REQUIRE(config->translation_options);
        REQUIRE(config->timeout_ms == 60000);
    }

    SECTION("Explicit URL and model win") {
        auto section = toml::parse(R"(
            api_url = "http://localhost:11434/v1"
            model = "llama3"
            connect_timeout_ms = -1
        )");
        auto config = BackendConfig::fromToml(section, error);
        REQUIRE(config.has_value());
        REQUIRE(config->base_url == "http://localhost:11434/v1");
        REQUIRE(config->model == "llama3");
        REQUIRE(config->connect_timeout_ms == 5000);
    }

    SECTION("Unknown backend is rejected") {
        auto section = toml::parse(R"(backend = "youdao")");
        auto config = BackendConfig::fromToml(section, error);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(error == "Unknown translator backend 'youdao'");
    }
}
