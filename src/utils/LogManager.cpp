#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    if (!PrepareLogDirectory())
        return false;

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

    try
    {
        bool append = config.append_override.value_or(s_settings.append);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_settings.level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
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
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

#if WORDCHEF_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_settings.append; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_settings.level; }

std::string LogManager::LogPath(const std::string& file_name)
{
    return (std::filesystem::path(s_settings.directory) / file_name).string();
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_settings.directory + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
