#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "translate/OpenAITranslator.hpp"
#include "../utils/mock_http.hpp"

using namespace translate;
using test_utils::MockHttpTransport;
using test_utils::MockResponses;

namespace {

BackendConfig openaiConfig() {
    BackendConfig config;
    config.backend = Backend::OpenAI;
    config.api_key = "test-key";
    config.base_url = "https://api.openai.com/v1/chat/completions";
    config.target_lang = "French";
    return config;
}

}  // namespace

TEST_CASE("OpenAI Translator", "[translate][openai]") {

    SECTION("Initialization") {
        OpenAITranslator translator(std::make_unique<MockHttpTransport>());

        SECTION("Fails with empty config") {
            BackendConfig config;
            REQUIRE_FALSE(translator.init(config));
            REQUIRE_FALSE(translator.isReady());
            REQUIRE(std::string(translator.lastError()) == "Missing API key");
        }

        SECTION("Fails without base URL") {
            auto config = openaiConfig();
            config.base_url.clear();
            REQUIRE_FALSE(translator.init(config));
            REQUIRE(std::string(translator.lastError()) == "Missing base URL");
        }

        SECTION("Succeeds with valid config") {
            REQUIRE(translator.init(openaiConfig()));
            REQUIRE(translator.isReady());
            translator.shutdown();
            REQUIRE_FALSE(translator.isReady());
        }

        SECTION("Not ready without proper initialization") {
            REQUIRE_FALSE(translator.isReady());
        }
    }

    SECTION("Request shape") {
        auto transport = std::make_unique<MockHttpTransport>();
        auto* mock = transport.get();
        mock->setResponse(MockResponses::openai_success("Bonjour le monde"));

        OpenAITranslator translator(std::move(transport));
        REQUIRE(translator.init(openaiConfig()));

        auto result = translator.translate("Hello world", "French", nullptr);
        REQUIRE(result.ok);
        REQUIRE(result.text == "Bonjour le monde");
        REQUIRE(result.error == ErrorKind::None);

        REQUIRE(mock->callCount() == 1);
        const auto& request = mock->requests().front();
        REQUIRE(request.url == "https://api.openai.com/v1/chat/completions");
        REQUIRE(request.header("Content-Type") == "application/json");
        REQUIRE(request.header("Authorization") == "Bearer test-key");

        auto body = nlohmann::json::parse(request.body);
        REQUIRE(body["model"].get<std::string>() == "gpt-3.5-turbo");
        REQUIRE(body["messages"].size() == 2);
        REQUIRE(body["messages"][0]["role"].get<std::string>() == "system");
        REQUIRE(body["messages"][0]["content"].get<std::string>() == "You are a professional translator.");
        REQUIRE(body["messages"][1]["role"].get<std::string>() == "user");
        REQUIRE(body["messages"][1]["content"].get<std::string>() == "Translate the following text to French: Hello world");
    }

    SECTION("Configured model and timeouts are used") {
        auto transport = std::make_unique<MockHttpTransport>();
        auto* mock = transport.get();
        mock->setResponse(MockResponses::openai_success("ok"));

        auto config = openaiConfig();
        config.model = "gpt-4o-mini";
        config.connect_timeout_ms = 1234;
        config.timeout_ms = 9999;

        OpenAITranslator translator(std::move(transport));
        REQUIRE(translator.init(config));
        REQUIRE(translator.translate("Hi", "German", nullptr).ok);

        const auto& request = mock->requests().front();
        REQUIRE(nlohmann::json::parse(request.body)["model"].get<std::string>() == "gpt-4o-mini");
        REQUIRE(request.session.connect_timeout_ms == 1234);
        REQUIRE(request.session.timeout_ms == 9999);
        REQUIRE(request.session.text_length_hint == 2);
    }

    SECTION("Empty text short-circuits") {
        auto transport = std::make_unique<MockHttpTransport>();
        auto* mock = transport.get();

        OpenAITranslator translator(std::move(transport));
        REQUIRE(translator.init(openaiConfig()));

        auto result = translator.translate("", "French", nullptr);
        REQUIRE(result.ok);
        REQUIRE(result.text.empty());
        REQUIRE(mock->callCount() == 0);
    }

    SECTION("Error handling") {
        auto transport = std::make_unique<MockHttpTransport>();
        auto* mock = transport.get();
        OpenAITranslator translator(std::move(transport));

        SECTION("Returns error when not initialized") {
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE_FALSE(result.ok);
            REQUIRE(result.error == ErrorKind::Configuration);
            REQUIRE(std::string(translator.lastError()) == "translator not ready");
            REQUIRE(mock->callCount() == 0);
        }

        REQUIRE(translator.init(openaiConfig()));

        SECTION("401 carries status and body") {
            mock->setResponse(MockResponses::openai_error_401());
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE_FALSE(result.ok);
            REQUIRE(result.error == ErrorKind::Provider);
            REQUIRE(result.status_code == 401);
            REQUIRE(result.response_body.find("Invalid API key provided") != std::string::npos);
            REQUIRE_FALSE(result.error_message.empty());
        }

        SECTION("429 is a provider error") {
            mock->setResponse(MockResponses::openai_error_quota());
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error == ErrorKind::Provider);
            REQUIRE(result.status_code == 429);
        }

        SECTION("Network failure is a transport error") {
            mock->setResponse(MockResponses::network_error());
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE_FALSE(result.ok);
            REQUIRE(result.error == ErrorKind::Transport);
            REQUIRE(result.error_message.find("Network connection failed") != std::string::npos);
        }

        SECTION("Invalid JSON") {
            mock->setResponse(MockResponses::openai_invalid_json());
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error == ErrorKind::MalformedResponse);
            REQUIRE(result.error_message == "response is not valid JSON");
            REQUIRE(result.status_code == 200);
        }

        SECTION("Non-object JSON") {
            mock->setResponse(MockResponses::raw(200, "[1, 2]"));
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error == ErrorKind::MalformedResponse);
            REQUIRE(result.error_message == "response is not a JSON object");
        }

        SECTION("Missing choices") {
            mock->setResponse(MockResponses::raw(200, R"({"id": "x"})"));
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error == ErrorKind::MalformedResponse);
            REQUIRE(result.error_message == "missing choices in response");
        }

        SECTION("Choices of the wrong type") {
            mock->setResponse(MockResponses::raw(200, R"({"choices": {"message": {}}})"));
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error_message == "missing choices in response");
        }

        SECTION("Empty choices") {
            mock->setResponse(MockResponses::raw(200, R"({"choices": []})"));
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error == ErrorKind::MalformedResponse);
            REQUIRE(result.error_message == "empty choices in response");
        }

        SECTION("First choice is not an object") {
            mock->setResponse(MockResponses::raw(200, R"({"choices": ["text"]})"));
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error_message == "invalid choices[0] in response");
        }

        SECTION("Missing message") {
            mock->setResponse(MockResponses::raw(200, R"({"choices": [{"index": 0}]})"));
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error_message == "missing choices[0].message in response");
        }

        SECTION("Content of the wrong type") {
            mock->setResponse(MockResponses::raw(200, R"({"choices": [{"message": {"content": 42}}]})"));
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE(result.error == ErrorKind::MalformedResponse);
            REQUIRE(result.error_message == "missing choices[0].message.content in response");
        }

        SECTION("Long input is sent in one request") {
            mock->setResponse(MockResponses::openai_success("long"));
            std::string huge(20000, 'a');
            auto result = translator.translate(huge, "French", nullptr);
            REQUIRE(result.ok);
            REQUIRE(result.text == "long");
            REQUIRE(mock->callCount() == 1);
            REQUIRE(mock->requests().front().session.text_length_hint == huge.size());
            auto body = nlohmann::json::parse(mock->requests().front().body);
            REQUIRE(body["messages"][1]["content"].get<std::string>() ==
                    "Translate the following text to French: " + huge);
        }

        SECTION("Cancelled transfer") {
            test_utils::MockResponse aborted;
            aborted.cancelled = true;
            mock->setResponse(aborted);
            auto result = translator.translate("test", "French", nullptr);
            REQUIRE_FALSE(result.ok);
            REQUIRE(result.error == ErrorKind::Cancelled);
            REQUIRE(result.error_message == "request cancelled");
            REQUIRE(std::string(translator.lastError()) == "request cancelled");
        }
    }
}

TEST_CASE("OpenAI URL normalization", "[translate][openai]") {
    REQUIRE(OpenAITranslator::normalizeURL("https://api.openai.com") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("https://api.openai.com/") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("https://api.openai.com/v1") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("https://api.openai.com/v1/chat/completions") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAITranslator::normalizeURL("http://localhost:8080/proxy/chat") ==
            "http://localhost:8080/proxy/chat");
    REQUIRE(OpenAITranslator::normalizeURL("").empty());
}
