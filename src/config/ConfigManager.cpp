#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace
{

bool splitPath(const std::string& path, std::vector<std::string>& segments)
{
    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Empty segment in config path '" << path << "'";
            return false;
        }
        segments.push_back(segment);
    }
    return true;
}

std::string describeParseError(const toml::parse_error& pe)
{
    std::string details(pe.description());
    const auto& begin = pe.source().begin;
    if (begin.line > 0)
        details = "line " + std::to_string(begin.line) + ", column " + std::to_string(begin.column) + ": " + details;
    return details;
}

bool contains(const std::vector<std::string>& keys, std::string_view key)
{
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (contains(handler.ownedKeys, key))
            {
                last_error_ = "key '" + key + "' at '" + path + "' already has an owner";
                PLOG_ERROR << "Config handler refused: " << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    load_failed_ = false;
    root_ = std::make_unique<toml::table>();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        return true;
    }

    try
    {
        *root_ = toml::parse(ifs, config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = describeParseError(pe);
        load_failed_ = true;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            last_error_ + " (" + config_path_ + ")");
        return false;
    }

    const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = findTable(*root_, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
    return true;
}

bool ConfigManager::save()
{
    if (load_failed_)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration not saved: fix the errors in the file first",
                                            last_error_ + " (" + config_path_ + ")");
        return false;
    }

    last_error_.clear();
    toml::table output = root_ ? *root_ : toml::table{};

    for (const auto& handler : handlers_)
    {
        toml::table* target = findOrCreateTable(output, handler.path);
        if (!target)
        {
            last_error_ = "cannot place section '" + handler.path + "'";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }

        toml::table written = handler.callbacks.save();
        for (const auto& [key, value] : written)
        {
            if (!contains(handler.ownedKeys, key.str()))
                PLOG_WARNING << "Config handler at '" << handler.path << "' wrote foreign key '" << key.str()
                             << "', dropped";
        }
        for (const auto& key : handler.ownedKeys)
        {
            if (written.contains(key))
                target->insert_or_assign(key, written[key]);
            else
                target->erase(key);
        }
    }

    if (!writeAtomically(output))
        return false;

    root_ = std::make_unique<toml::table>(std::move(output));
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

bool ConfigManager::writeAtomically(const toml::table& output)
{
    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "cannot open " + tmp + " for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
        ofs << output << '\n';
        if (!ofs.flush())
        {
            last_error_ = "write to " + tmp + " failed";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "rename failed: " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

toml::table* ConfigManager::findOrCreateTable(toml::table& root, const std::string& path)
{
    std::vector<std::string> segments;
    if (!splitPath(path, segments))
        return nullptr;

    toml::table* current = &root;
    for (const auto& segment : segments)
    {
        auto [it, inserted] = current->insert(segment, toml::table{});
        current = it->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Config key '" << segment << "' is not a table";
            return nullptr;
        }
    }
    return current;
}

const toml::table* ConfigManager::findTable(const toml::table& root, const std::string& path)
{
    std::vector<std::string> segments;
    if (!splitPath(path, segments))
        return nullptr;

    const toml::table* current = &root;
    for (const auto& segment : segments)
    {
        current = current->get_as<toml::table>(segment);
        if (!current)
            return nullptr;
    }
    return current;
}
