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
    struct Settings
    {
        std::string directory = "logs";
        bool append = true;
        bool console = false;
        plog::Severity level = plog::info;
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const Settings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static std::string LogPath(const std::string& file_name);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
