#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Loads config.toml once and dispatches each registered section to its owner.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    const toml::table& root() const;
    const std::string& path() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void dispatch();

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
