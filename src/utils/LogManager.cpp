#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    if (!ReadConfig(config_path))
        return false;

    PrepareLogDirectory();

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
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
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

void LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories("logs", ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

bool LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return true;

    try
    {
        auto cfg = toml::parse_file(config_path);
        auto* logging = cfg["logging"].as_table();
        if (!logging)
            return true;

        if (auto append = (*logging)["append"].value<bool>())
            s_append_logs = *append;

        if (auto name = (*logging)["level"].value<std::string>())
        {
            plog::Severity level = plog::severityFromString(name->c_str());
            if (level == plog::none && *name != "none")
                ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown log level, keeping default",
                                             "logging.level = " + *name);
            else
                s_default_level = level;
        }
        else if (auto number = (*logging)["level"].value<int64_t>())
        {
            if (*number >= plog::none && *number <= plog::verbose)
                s_default_level = static_cast<plog::Severity>(*number);
            else
                ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Log level out of range, keeping default",
                                             "logging.level = " + std::to_string(*number));
        }

        return true;
    }
    catch (const toml::parse_error& pe)
    {
        // Logging still comes up with defaults; ConfigManager reports the details.
        PLOG_WARNING << "Logging settings ignored: " << pe.description();
        return true;
    }
}

} // namespace utils
