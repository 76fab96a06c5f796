#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& key : ownedKeys)
    {
        if (ownerOf(path, key))
        {
            last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

const ConfigManager::HandlerEntry* ConfigManager::ownerOf(const std::string& path, const std::string& key) const
{
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [&](const HandlerEntry& h)
                           {
                               return h.path == path &&
                                      std::find(h.ownedKeys.begin(), h.ownedKeys.end(), key) != h.ownedKeys.end();
                           });
    return it == handlers_.end() ? nullptr : &*it;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        dispatch();
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return parseAndDispatch(buffer.str(), config_path_);
}

bool ConfigManager::loadFromString(std::string_view document, std::string_view source_name)
{
    last_error_.clear();
    return parseAndDispatch(document, source_name);
}

bool ConfigManager::parseAndDispatch(std::string_view document, std::string_view source_name)
{
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(document, source_name));
    }
    catch (const toml::parse_error& pe)
    {
        const auto& where = pe.source().begin;
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_ << " (" << std::string(source_name) << ":" << where.line << ":" << where.column
                     << ")";

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            std::string(source_name) + ":" + std::to_string(where.line) + ": " +
                                                std::string(pe.description()));
        root_ = std::make_unique<toml::table>();
        dispatch();
        return false;
    }

    dispatch();
    PLOG_INFO << "Loaded config from " << std::string(source_name);
    return true;
}

void ConfigManager::dispatch()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        if (!handler.callbacks.load)
            continue;

        const toml::table* section =
            handler.path.empty() ? root_.get() : root_->at_path(handler.path).as_table();
        if (section)
        {
            warnUnknownKeys(handler.path, *section);
            handler.callbacks.load(*section);
        }
        else
        {
            handler.callbacks.load(empty);
        }
    }
}

void ConfigManager::warnUnknownKeys(const std::string& path, const toml::table& section) const
{
    for (const auto& [key, value] : section)
    {
        const std::string name(key.str());
        if (!ownerOf(path, name))
            PLOG_WARNING << "Ignoring unknown config key '" << name << "' in [" << path << "]";
    }
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}
