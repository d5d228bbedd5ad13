#pragma once

#include "../translate/ITranslator.hpp"

#include <memory>
#include <optional>
#include <string>

class ConfigManager;

class Application
{
public:
    enum ExitCode
    {
        Ok = 0,
        UsageError = 1,
        ConfigError = 2,
        IoError = 3,
        StructuralError = 4
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct Options
    {
        std::string input_path;
        std::string output_path;
        std::string target_lang;
        std::string config_path = "config.toml";
        bool show_help = false;
    };

    bool parseCommandLineArgs(std::string& error);
    bool initializeLogging();
    bool initializeConfig();
    bool initializeTranslator();
    int runTranslation();
    void printUsage() const;
    void printErrorSummary() const;

    int argc_;
    char** argv_;
    Options options_;
    std::unique_ptr<ConfigManager> config_;
    std::optional<translate::BackendConfig> backend_config_;
    std::string config_error_;
    std::unique_ptr<translate::ITranslator> translator_;
};
