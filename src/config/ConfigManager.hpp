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

class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    // path is dotted ("resources" or "app.debug"); a path may only be registered once.
    bool registerTable(const std::string& path, TableCallbacks cb);

    // A missing file is not an error: every handler sees an empty table and keeps its defaults.
    bool load();

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    bool fileFound() const { return file_found_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
