#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns the TOML file. Each registered handler reads the table at its path on
// load() and writes back only the keys it owns on save(); keys nobody owns
// survive a save untouched.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    // ownedKeys are the top-level keys of `path` this handler writes back on save.
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error; handlers keep their defaults.
    bool load();
    // Refused while the file on disk failed to parse, so it is never replaced by defaults.
    bool save();

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    static toml::table* findOrCreateTable(toml::table& root, const std::string& path);
    static const toml::table* findTable(const toml::table& root, const std::string& path);
    bool writeAtomically(const toml::table& output);

    std::string config_path_;
    std::string last_error_;
    bool load_failed_ = false;
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
