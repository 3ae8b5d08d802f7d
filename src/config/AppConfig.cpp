#include "AppConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <string>

namespace
{

void reportOutOfRange(const std::string& key, long long value)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Ignoring out-of-range setting",
                                        key + " = " + std::to_string(value));
}

} // namespace

bool registerAppConfigTables(ConfigManager& manager, AppConfig& config)
{
    bool ok = true;

    ok &= manager.registerTable("logging", { [&config](const toml::table& t)
    {
        if (auto level = t["level"].value<int64_t>())
        {
            if (*level >= 0 && *level <= 6)
                config.logging.level = static_cast<int>(*level);
            else
                reportOutOfRange("logging.level", *level);
        }
        if (auto append = t["append"].value<bool>())
            config.logging.append = *append;
        if (auto console = t["console"].value<bool>())
            config.logging.console = *console;
        if (auto directory = t["directory"].value<std::string>())
            config.logging.directory = *directory;
    } });

    ok &= manager.registerTable("diagnostics", { [&config](const toml::table& t)
    {
        if (auto verbose = t["verbose"].value<bool>())
            config.diagnostics.verbose = *verbose;
        if (auto preview = t["max_preview"].value<int64_t>())
        {
            if (*preview > 0)
                config.diagnostics.max_preview = static_cast<std::size_t>(*preview);
            else
                reportOutOfRange("diagnostics.max_preview", *preview);
        }
    } });

    ok &= manager.registerTable("resources", { [&config](const toml::table& t)
    {
        if (auto directory = t["directory"].value<std::string>())
            config.resources.directory = *directory;
        if (auto language = t["language"].value<std::string>())
            config.resources.language = *language;
    } });

    ok &= manager.registerTable("summary", { [&config](const toml::table& t)
    {
        if (auto max = t["max_sentences"].value<int64_t>())
        {
            if (*max >= 1)
                config.summary.max_sentences = static_cast<std::size_t>(*max);
            else
                reportOutOfRange("summary.max_sentences", *max);
        }
    } });

    return ok;
}
