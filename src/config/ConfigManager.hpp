#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Loads the service TOML file and hands each registered section to its owner.
// Sections not present in the file are delivered as empty tables so owners
// always get a chance to apply their defaults.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error. Returns false on a parse error; handlers then see empty tables.
    bool load();
    bool loadFromString(std::string_view document, std::string_view source_name = "<memory>");

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool parseAndDispatch(std::string_view document, std::string_view source_name);
    void dispatch();
    void warnUnknownKeys(const std::string& path, const toml::table& section) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    const HandlerEntry* ownerOf(const std::string& path, const std::string& key) const;

    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
