#include <catch2/catch_test_macros.hpp>
#include "translate/ITranslator.hpp"
#include "../utils/mock_http.hpp"

TEST_CASE("Translator Factory", "[translate][factory]") {

    SECTION("Creates OpenAI translator") {
        auto translator = translate::createTranslator(translate::Backend::OpenAI);
        REQUIRE(translator != nullptr);
        REQUIRE(std::string(translator->providerName()) == "OpenAI");

        translate::BackendConfig config;
        config.backend = translate::Backend::OpenAI;
        config.api_key = "test-key";
        config.base_url = "https://api.openai.com";
        config.target_lang = "en-us";

        REQUIRE(translator->init(config));
        REQUIRE(translator->isReady());
        translator->shutdown();
    }

    SECTION("Creates Dashscope translator") {
        auto translator = translate::createTranslator(translate::Backend::Dashscope);
        REQUIRE(translator != nullptr);
        REQUIRE(std::string(translator->providerName()) == "Dashscope");

        translate::BackendConfig config;
        config.backend = translate::Backend::Dashscope;
        REQUIRE_FALSE(translator->init(config));
        REQUIRE(std::string(translator->lastError()) == "Missing API key");
    }

    SECTION("Injected transport receives the requests") {
        auto transport = std::make_unique<test_utils::MockHttpTransport>();
        auto* mock = transport.get();
        mock->setResponse(test_utils::MockResponses::openai_success("Hola"));

        auto translator = translate::createTranslator(translate::Backend::OpenAI, std::move(transport));
        translate::BackendConfig config;
        config.api_key = "k";
        config.base_url = "https://example.test/v1";
        REQUIRE(translator->init(config));

        auto result = translator->translate("Hello", "Spanish", nullptr);
        REQUIRE(result.ok);
        REQUIRE(result.text == "Hola");
        REQUIRE(mock->callCount() == 1);
        REQUIRE(mock->requests().front().url == "https://example.test/v1/chat/completions");
    }

    SECTION("Backend enum values are correct") {
        REQUIRE(static_cast<int>(translate::Backend::OpenAI) == 0);
        REQUIRE(static_cast<int>(translate::Backend::Dashscope) == 1);
    }
}
