#include "Application.hpp"

#include "../config/ConfigManager.hpp"
#include "../document/DocumentJson.hpp"
#include "../document/DocumentTranslator.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>

namespace
{

std::atomic<bool> g_cancel_requested{ false };

extern "C" void onInterrupt(int)
{
    g_cancel_requested.store(true);
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    translator_.reset();
    utils::LogManager::Shutdown();
}

int Application::run()
{
    std::string arg_error;
    if (!parseCommandLineArgs(arg_error))
    {
        std::cerr << "error: " << arg_error << "\n\n";
        printUsage();
        return UsageError;
    }
    if (options_.show_help)
    {
        printUsage();
        return Ok;
    }

    initializeLogging();
    PLOG_INFO << "docxlate starting: " << options_.input_path << " -> " << options_.output_path;

    if (!initializeConfig() || !initializeTranslator())
    {
        printErrorSummary();
        return ConfigError;
    }

    const int code = runTranslation();
    printErrorSummary();
    return code;
}

bool Application::parseCommandLineArgs(std::string& error)
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        auto next_value = [&](const char* flag, std::string& out) {
            if (i + 1 >= argc_)
            {
                error = std::string("missing value for ") + flag;
                return false;
            }
            out = argv_[++i];
            return true;
        };

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
        {
            options_.show_help = true;
            return true;
        }
        else if (std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "--input") == 0)
        {
            if (!next_value(arg, options_.input_path))
                return false;
        }
        else if (std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0)
        {
            if (!next_value(arg, options_.output_path))
                return false;
        }
        else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--target") == 0)
        {
            if (!next_value(arg, options_.target_lang))
                return false;
        }
        else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0)
        {
            if (!next_value(arg, options_.config_path))
                return false;
        }
        else
        {
            error = std::string("unknown argument '") + arg + "'";
            return false;
        }
    }

    if (options_.input_path.empty())
    {
        error = "--input is required";
        return false;
    }
    if (options_.output_path.empty())
    {
        error = "--output is required";
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(options_.config_path))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = utils::LogManager::GetDefaultLogFile(),
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = 10 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .console_override = std::nullopt });
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);

    config_->registerTable(
        "translator",
        { .load =
              [this](const toml::table& section) {
                  backend_config_ = translate::BackendConfig::fromToml(section, config_error_);
              } },
        { "backend", "api_key", "api_url", "model", "source_lang", "target_lang", "translation_options",
          "connect_timeout_ms", "timeout_ms" });
    // Owned by LogManager, which reads it before the logger exists.
    config_->registerTable("logging", { .load = [](const toml::table&) {} }, { "level", "file", "append", "console" });

    if (!config_->load())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                          config_->lastError());
        return false;
    }

    if (!backend_config_)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid [translator] section",
                                          config_error_);
        return false;
    }

    if (options_.target_lang.empty())
        options_.target_lang = backend_config_->target_lang;
    if (options_.target_lang.empty())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "No target language",
                                          "pass --target or set translator.target_lang");
        return false;
    }
    return true;
}

bool Application::initializeTranslator()
{
    translator_ = translate::createTranslator(backend_config_->backend);
    if (!translator_)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Unsupported translator backend",
                                          translate::backendName(backend_config_->backend));
        return false;
    }

    if (!translator_->init(*backend_config_))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration,
                                          std::string(translator_->providerName()) + " translator not configured",
                                          translator_->lastError());
        return false;
    }
    return true;
}

int Application::runTranslation()
{
    document::Document source;
    std::string error;
    if (!document::loadDocument(options_.input_path, source, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::IO, "Failed to read input document", error);
        return IoError;
    }

    g_cancel_requested.store(false);
    auto previous_handler = std::signal(SIGINT, onInterrupt);

    document::DocumentTranslator translator(*translator_);
    auto result = translator.translateDocument(source, options_.target_lang, &g_cancel_requested);

    std::signal(SIGINT, previous_handler == SIG_ERR ? SIG_DFL : previous_handler);

    if (!result.ok)
        return StructuralError;

    if (!document::saveDocument(options_.output_path, result.document, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::IO, "Failed to write output document", error);
        return IoError;
    }

    std::cout << "Translated " << result.stats.paragraphs_translated << " of " << result.stats.paragraphs_total
              << " paragraphs into " << options_.target_lang << " (" << result.stats.paragraphs_skipped << " blank, "
              << result.stats.paragraphs_failed << " kept in source language)"
              << (result.cancelled ? ", cancelled" : "") << "\n";
    return Ok;
}

void Application::printUsage() const
{
    std::cerr << "Usage: " << (argc_ > 0 ? argv_[0] : "docxlate")
              << " --input <document.json> --output <document.json> [options]\n"
              << "  -i, --input <path>     source document (JSON)\n"
              << "  -o, --output <path>    translated document (JSON)\n"
              << "  -t, --target <lang>    target language, overrides translator.target_lang\n"
              << "  -c, --config <path>    configuration file (default: config.toml)\n"
              << "  -h, --help             show this help\n";
}

void Application::printErrorSummary() const
{
    auto reports = utils::ErrorReporter::GetPendingErrors();
    if (reports.empty())
        return;

    std::cerr << reports.size() << " problem(s) reported:\n";
    for (const auto& report : reports)
    {
        std::cerr << "  [" << utils::ErrorReporter::SeverityToString(report.severity) << "] ["
                  << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << ": " << report.technical_details;
        std::cerr << "\n";
    }
}
