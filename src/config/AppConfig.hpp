#pragma once

#include <cstddef>
#include <string>

struct LoggingConfig
{
    int level = 4; // plog severity: 0 none .. 6 verbose
    bool append = true;
    bool console = false;
    std::string directory = "logs";
};

struct DiagnosticsConfig
{
    bool verbose = false;
    std::size_t max_preview = 160;
};

struct ResourcesConfig
{
    std::string directory = "assets/lexicon";
    std::string language = "es";
};

struct SummaryConfig
{
    std::size_t max_sentences = 3;
};

struct AppConfig
{
    LoggingConfig logging;
    DiagnosticsConfig diagnostics;
    ResourcesConfig resources;
    SummaryConfig summary;
};

class ConfigManager;

// Registers the [logging], [diagnostics], [resources] and [summary] tables so that
// ConfigManager::load() fills config. Out-of-range values keep their defaults.
bool registerAppConfigTables(ConfigManager& manager, AppConfig& config);
