#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "config/StateSerializer.hpp"
#include "translate/Languages.hpp"
#include "translate/OpenAITranslator.hpp"
#include "translate/ScriptLanguageDetector.hpp"
#include "translate/TranslationOrchestrator.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <chrono>
#include <cstring>
#include <iterator>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <clocale>
#endif

namespace
{

constexpr auto kFrameWait = std::chrono::milliseconds(16);
constexpr auto kShutdownWait = std::chrono::milliseconds(5000);

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    if (reader_.joinable())
        reader_.join();
}

bool Application::initialize()
{
    if (!parseCommandLineArgs())
        return false;

    if (!initializeLogging())
        return false;

    initializeConsole();
    initializeConfig();
    return setupOrchestrator();
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_path_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = "logs/run.log",
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = false });

    utils::ErrorReporter::InitializeLogFile("logs/errors.log");
    return true;
}

void Application::initializeConsole()
{
#ifdef _WIN32
    // Set Windows console to UTF-8 so non-ASCII text displays correctly
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
    std::setlocale(LC_ALL, ".UTF-8");
#endif
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(config_path_);

    TableCallbacks cb;
    cb.load = [this](const toml::table& section) {
        StateSerializer::deserializeTranslation(section, translation_config_, backend_config_);
    };
    cb.save = [this]() -> toml::table {
        return StateSerializer::serializeTranslation(translation_config_, backend_config_);
    };
    config_->registerTable("", std::move(cb), { "translation" });

    if (!config_->load())
        PLOG_WARNING << "Continuing with default settings: " << config_->lastError();

    if (source_override_)
        translation_config_.default_source_lang = *source_override_;
    if (target_override_)
        translation_config_.default_target_lang = *target_override_;

    PLOG_INFO << "Configuration loaded from " << config_->path() << ": " << translation_config_.default_source_lang
              << " -> " << translation_config_.default_target_lang << ", backend " << backend_config_.base_url
              << " (" << backend_config_.model << ")";
}

bool Application::setupOrchestrator()
{
    auto translator =
        std::make_shared<translate::OpenAITranslator>(backend_config_, translation_config_.translation_timeout_ms);
    if (!translator->isReady())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization,
                                          "Translation backend is not configured",
                                          "Set translation.backend.base_url and translation.backend.model in " +
                                              config_path_);
        return false;
    }

    const std::string status = translator->testConnection();
    if (!status.empty())
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Translation backend check did not pass", status);

    try
    {
        orchestrator_ = std::make_unique<translate::TranslationOrchestrator>(
            std::move(translator), std::make_shared<translate::ScriptLanguageDetector>(), translation_config_);
    }
    catch (const std::exception& e)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to start translation engine",
                                          e.what());
        return false;
    }

    translate::OrchestratorCallbacks callbacks;
    callbacks.onStarted = [](translate::TaskId id) { std::cout << "[" << id << "] started" << std::endl; };
    callbacks.onProgress = [](translate::TaskId id, int pct, const std::string& message) {
        std::cout << "[" << id << "] " << pct << "% " << message << std::endl;
    };
    callbacks.onComplete = [](translate::TaskId id, const std::string& lang, const std::string& text) {
        std::cout << "[" << id << "] (" << lang << ") " << text << std::endl;
    };
    callbacks.onError = [](translate::TaskId id, const translate::TranslationError& error) {
        std::cout << "[" << id << "] failed: " << translate::toString(error.kind) << std::endl;
    };
    callbacks.onRetrying = [](translate::TaskId id, int attempt, int max_attempts, int delay_ms) {
        std::cout << "[" << id << "] attempt " << attempt << "/" << max_attempts << " failed, retrying in "
                  << delay_ms << " ms" << std::endl;
    };
    callbacks.onFinished = [](translate::TaskId id) { PLOG_DEBUG << "Task " << id << " finished"; };
    orchestrator_->setCallbacks(std::move(callbacks));
    return true;
}

int Application::run()
{
    if (!initialize())
    {
        printPendingErrors();
        return exit_code_;
    }

    startInputReader();
    mainLoop();
    cleanup();
    printPendingErrors();
    return exit_code_;
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        auto next = [&]() -> const char* { return (i + 1 < argc_) ? argv_[++i] : nullptr; };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            printUsage();
            return false;
        }
        else if (std::strcmp(arg, "--no-debounce") == 0)
        {
            debounce_ = false;
        }
        else if (std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--source") == 0 ||
                 std::strcmp(arg, "--target") == 0)
        {
            const char* value = next();
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                exit_code_ = 2;
                return false;
            }
            if (std::strcmp(arg, "--config") == 0)
            {
                config_path_ = value;
            }
            else if (std::strcmp(arg, "--source") == 0)
            {
                if (!translate::isSupportedSource(value))
                {
                    std::cerr << "Unsupported source language: " << value << std::endl;
                    exit_code_ = 2;
                    return false;
                }
                source_override_ = value;
            }
            else
            {
                if (!translate::isSupportedTarget(value))
                {
                    std::cerr << "Unsupported target language: " << value << std::endl;
                    exit_code_ = 2;
                    return false;
                }
                target_override_ = value;
            }
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage();
            exit_code_ = 2;
            return false;
        }
    }
    return true;
}

void Application::printUsage() const
{
    std::cout << "Usage: localtranslate [--config PATH] [--source LANG] [--target LANG] [--no-debounce]\n"
              << "Translates lines read from standard input. By default rapid input is debounced and only\n"
              << "the latest line is translated; with --no-debounce every line is translated in turn.\n\nLanguages:\n";
    for (const auto& lang : translate::supportedLanguages())
        std::cout << "  " << lang.code << "\t" << lang.name << " (" << lang.display_name << ")\n";
    std::cout.flush();
}

void Application::startInputReader()
{
    reader_ = std::thread([this] {
        std::string line;
        while (std::getline(std::cin, line))
            input_.push(std::move(line));
        input_closed_.store(true);
        input_.wake();
    });
}

void Application::handleInput()
{
    std::vector<std::string> lines;
    input_.drain(lines);
    backlog_.insert(backlog_.end(), std::make_move_iterator(lines.begin()), std::make_move_iterator(lines.end()));

    // Debounced input coalesces; otherwise lines run one at a time.
    while (!backlog_.empty() && (debounce_ || orchestrator_->isIdle()))
    {
        const auto id = orchestrator_->submit(backlog_.front(), translation_config_.default_source_lang,
                                              translation_config_.default_target_lang, debounce_);
        PLOG_DEBUG << "Submitted line as task " << id;
        backlog_.pop_front();
        if (!debounce_)
            break;
    }
}

void Application::mainLoop()
{
    for (;;)
    {
        handleInput();
        orchestrator_->waitForEvents(kFrameWait);
        orchestrator_->processEvents();
        printPendingErrors();

        if (input_closed_.load() && input_.empty() && backlog_.empty() && orchestrator_->isIdle())
            break;
    }
    PLOG_INFO << "Input closed and all tasks settled";
}

void Application::printPendingErrors()
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::SeverityToString(report.severity) << ": " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << "\n  " << report.technical_details;
        std::cerr << std::endl;

        if (report.is_fatal)
            exit_code_ = 1;
    }
}

void Application::cleanup()
{
    if (orchestrator_ && !orchestrator_->shutdown(kShutdownWait))
        PLOG_WARNING << "Translation workers did not stop in time";
    orchestrator_.reset();

    if (config_)
        config_->save();
}
