#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        std::optional<bool> console_override;
    };

    // Reads the [logging] table of config_path. A missing file keeps the defaults.
    static bool Initialize(const std::string& config_path);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsAppendMode();
    static bool UsesConsole();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetDefaultLogFile();
    static void PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static bool ReadConfig(const std::string& config_path);

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_console;
    static plog::Severity s_default_level;
    static std::string s_log_file;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
