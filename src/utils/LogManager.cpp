#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_console = true;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_log_file = "logs/docxlate.log";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    if (!ReadConfig(config_path))
        return false;

    PrepareLogDirectory(s_log_file);

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    // plog keeps its loggers for the life of the process; a second
    // registration only updates the severity.
    if (auto existing = plog::get<InstanceId>())
    {
        existing->setMaxSeverity(config.level_override.value_or(s_default_level));
        return true;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.console_override.value_or(s_console))
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    // Appenders stay alive because the plog logger still points at them.
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

bool LogManager::UsesConsole() { return s_console; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::GetDefaultLogFile() { return s_log_file; }

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

bool LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return true;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto logging = cfg["logging"].as_table())
        {
            if (auto append = (*logging)["append"].value<bool>())
                s_append_logs = *append;
            if (auto console = (*logging)["console"].value<bool>())
                s_console = *console;
            if (auto file = (*logging)["file"].value<std::string>())
            {
                if (!file->empty())
                    s_log_file = *file;
            }
            if (auto level = (*logging)["level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
            }
        }

        return true;
    }
    catch (const toml::parse_error& pe)
    {
        // The configuration layer reports the parse error with full detail; logging keeps its defaults.
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Logging settings ignored",
                                     std::string(pe.description()));
        return true;
    }
}

} // namespace utils
