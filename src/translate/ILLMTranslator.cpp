#include "ILLMTranslator.hpp"

#include <plog/Log.h>

namespace translate
{

ILLMTranslator::ILLMTranslator(std::unique_ptr<HttpTransport> transport)
    : transport_(std::move(transport))
{
    if (!transport_)
        transport_ = std::make_unique<CprTransport>();
}

ILLMTranslator::~ILLMTranslator()
{
    shutdown();
}

bool ILLMTranslator::init(const BackendConfig& cfg)
{
    shutdown();
    cfg_ = cfg;
    last_error_.clear();

    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
    {
        last_error_ = validation_error;
        return false;
    }

    if (cfg_.model.empty())
        cfg_.model = defaultModel();

    initialized_ = true;
    PLOG_INFO << providerName() << " translator ready (model " << cfg_.model << ")";
    return true;
}

bool ILLMTranslator::isReady() const
{
    return initialized_ && !cfg_.api_key.empty() && !cfg_.base_url.empty();
}

void ILLMTranslator::shutdown()
{
    initialized_ = false;
}

TranslationResult ILLMTranslator::translate(const std::string& text, const std::string& dst_lang,
                                            const std::atomic<bool>* cancel_flag)
{
    if (text.empty())
    {
        TranslationResult result;
        result.ok = true;
        return result;
    }

    if (!isReady())
        return fail(ErrorKind::Configuration, "translator not ready");

    Job job;
    job.text = text;
    job.dst = dst_lang.empty() ? cfg_.target_lang : dst_lang;

    auto prompt = buildPrompt(job);
    nlohmann::json body_json = nlohmann::json::object();
    buildRequestBody(job, prompt, body_json);
    const std::string body = body_json.dump();
    PLOG_DEBUG << "final post body: " << body;

    std::vector<Header> headers;
    buildHeaders(job, headers);

    SessionConfig session_cfg;
    session_cfg.cancel_flag = cancel_flag;
    session_cfg.text_length_hint = job.text.size();
    configureSession(job, session_cfg);

    const auto response = transport_->postJson(buildUrl(job), body, headers, session_cfg);

    if (response.cancelled)
        return fail(ErrorKind::Cancelled, "request cancelled");

    if (!response.error.empty())
    {
        auto err_type = helpers::categorize_http_error(0, response.error);
        return fail(ErrorKind::Transport, helpers::get_error_description(err_type, 0, response.error));
    }

    if (response.status_code < 200 || response.status_code >= 300)
    {
        auto err_type = helpers::categorize_http_error(response.status_code, "");
        auto result = fail(ErrorKind::Provider,
                           helpers::get_error_description(err_type, response.status_code, response.text));
        result.status_code = response.status_code;
        result.response_body = response.text;
        return result;
    }

    std::string translated;
    auto parse = parseResponse(job, response, translated);
    if (!parse.ok)
    {
        auto result = fail(ErrorKind::MalformedResponse,
                           parse.error_message.empty() ? "invalid API response format" : parse.error_message);
        result.status_code = response.status_code;
        result.response_body = response.text;
        return result;
    }

    PLOG_DEBUG << providerName() << " translation [-> " << job.dst << "]: '" << job.text << "' -> '" << translated
               << "'";

    TranslationResult result;
    result.ok = true;
    result.status_code = response.status_code;
    result.text = std::move(translated);
    return result;
}

TranslationResult ILLMTranslator::fail(ErrorKind kind, std::string message)
{
    last_error_ = message;
    PLOG_WARNING << providerName() << " request failed (" << errorKindName(kind) << "): " << message;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation,
                                        std::string(providerName()) + " request failed", message);

    TranslationResult result;
    result.error = kind;
    result.error_message = std::move(message);
    return result;
}

std::string ILLMTranslator::validateConfig(const BackendConfig& cfg) const
{
    if (cfg.api_key.empty())
        return "Missing API key";
    if (cfg.base_url.empty())
        return "Missing base URL";
    return {};
}

void ILLMTranslator::buildHeaders(const Job& job, std::vector<Header>& headers) const
{
    (void)job;
    headers.push_back({ "Content-Type", "application/json" });
    headers.push_back({ "Authorization", std::string("Bearer ") + cfg_.api_key });
}

std::string ILLMTranslator::buildUrl(const Job& job) const
{
    (void)job;
    return cfg_.base_url;
}

void ILLMTranslator::buildRequestBody(const Job& job, const Prompt& prompt, nlohmann::json& body) const
{
    (void)job;
    body["model"] = cfg_.model;
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : prompt.messages)
        messages.push_back({ { "role", roleName(message.role) }, { "content", message.content } });
    body["messages"] = std::move(messages);
}

ILLMTranslator::ParseResult ILLMTranslator::parseResponse(const Job& job, const HttpResponse& resp,
                                                          std::string& out) const
{
    (void)job;
    ParseResult result;
    // Non-throwing parse; json::value_t::discarded signals invalid input.
    auto json = nlohmann::json::parse(resp.text, nullptr, false);
    if (json.is_discarded())
    {
        result.error_message = "response is not valid JSON";
        return result;
    }
    if (!json.is_object())
    {
        result.error_message = "response is not a JSON object";
        return result;
    }

    auto choices = json.find("choices");
    if (choices == json.end() || !choices->is_array())
    {
        result.error_message = "missing choices in response";
        return result;
    }
    if (choices->empty())
    {
        result.error_message = "empty choices in response";
        return result;
    }

    const auto& choice = choices->at(0);
    if (!choice.is_object())
    {
        result.error_message = "invalid choices[0] in response";
        return result;
    }

    auto message = choice.find("message");
    if (message == choice.end() || !message->is_object())
    {
        result.error_message = "missing choices[0].message in response";
        return result;
    }

    auto content = message->find("content");
    if (content == message->end() || !content->is_string())
    {
        result.error_message = "missing choices[0].message.content in response";
        return result;
    }

    out = content->get<std::string>();
    result.ok = true;
    return result;
}

void ILLMTranslator::configureSession(const Job&, SessionConfig& cfg) const
{
    cfg.connect_timeout_ms = cfg_.connect_timeout_ms;
    cfg.timeout_ms = cfg_.timeout_ms;
}

const char* ILLMTranslator::roleName(Role role)
{
    switch (role)
    {
    case Role::System:
        return "system";
    case Role::Assistant:
        return "assistant";
    default:
        return "user";
    }
}

void ILLMTranslator::replaceAll(std::string& target, const std::string& placeholder, const std::string& value)
{
    if (placeholder.empty())
        return;
    size_t pos = 0;
    while ((pos = target.find(placeholder, pos)) != std::string::npos)
    {
        target.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

} // namespace translate
