#pragma once

#include "state/TranslationConfig.hpp"
#include "utils/PendingQueue.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>

class ConfigManager;

namespace translate
{
class TranslationOrchestrator;
}

// Command-line front end: reads lines from stdin, translates each one and
// prints lifecycle events. Exits once stdin is closed and all work has settled.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initialize();
    bool initializeLogging();
    void initializeConsole();
    void initializeConfig();
    bool setupOrchestrator();

    // Returns false when the program should exit without running (help or bad arguments).
    bool parseCommandLineArgs();
    void printUsage() const;

    void startInputReader();
    void mainLoop();
    void handleInput();
    void printPendingErrors();
    void cleanup();

    std::unique_ptr<ConfigManager> config_;
    TranslationConfig translation_config_;
    BackendConfig backend_config_;
    std::unique_ptr<translate::TranslationOrchestrator> orchestrator_;

    utils::PendingQueue<std::string> input_;
    std::deque<std::string> backlog_; // --no-debounce: lines waiting for the engine to go idle
    std::thread reader_;
    std::atomic<bool> input_closed_{ false };

    std::string config_path_ = "config.toml";
    std::optional<std::string> source_override_;
    std::optional<std::string> target_override_;
    bool debounce_ = true;
    int exit_code_ = 0;

    int argc_ = 0;
    char** argv_ = nullptr;
};
