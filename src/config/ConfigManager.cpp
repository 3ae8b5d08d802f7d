#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            last_error_ = "Duplicate registration for table '" + path + "'";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::ifstream ifs(config_path_, std::ios::binary);
    file_found_ = static_cast<bool>(ifs);
    if (!file_found_)
    {
        root_ = std::make_unique<toml::table>();
    }
    else
    {
        try
        {
            root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
        }
        catch (const toml::parse_error& pe)
        {
            last_error_ = std::string("config parse error: ") + std::string(pe.description());
            PLOG_WARNING << last_error_;

            std::string error_details;
            if (pe.source().begin.line > 0)
            {
                error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                                std::string(pe.description());
            }
            else
            {
                error_details = std::string(pe.description());
            }

            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Configuration file has errors. Using defaults.",
                                                error_details + "\nFile: " + config_path_);
            root_ = std::make_unique<toml::table>();
        }
    }

    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        if (section)
        {
            handler.callbacks.load(*section);
        }
        else
        {
            toml::table empty;
            handler.callbacks.load(empty);
        }
    }

    return last_error_.empty();
}

const toml::table& ConfigManager::root() const { return *root_; }

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    const toml::table* current = &root;
    std::istringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '.'))
    {
        const toml::node* node = current->get(segment);
        if (!node || !node->is_table())
            return nullptr;
        current = node->as_table();
    }
    return current;
}
