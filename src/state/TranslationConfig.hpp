#pragma once

#include <string>

// Orchestrator settings, persisted under [translation].
struct TranslationConfig
{
    int debounce_ms;
    int max_retries;
    int memory_error_max_retries;
    int initial_retry_delay_ms;
    int max_retry_delay_ms;
    double backoff_multiplier;
    int translation_timeout_ms;

    int max_text_length;  // codepoints
    int worker_threads;   // 0 = clamp(cpu_count, 2, 4)

    std::string default_source_lang;
    std::string default_target_lang;

    TranslationConfig() { applyDefaults(); }

    void applyDefaults()
    {
        debounce_ms = 500;
        max_retries = 3;
        memory_error_max_retries = 1;
        initial_retry_delay_ms = 1000;
        max_retry_delay_ms = 10000;
        backoff_multiplier = 2.0;
        translation_timeout_ms = 60000;

        max_text_length = 2000;
        worker_threads = 0;

        default_source_lang = "auto";
        default_target_lang = "ko";
    }
};

// OpenAI-compatible chat completions endpoint, persisted under [translation.backend].
struct BackendConfig
{
    std::string base_url;
    std::string model;
    std::string api_key;
    int connect_timeout_ms;
    double temperature;

    BackendConfig() { applyDefaults(); }

    void applyDefaults()
    {
        base_url = "http://127.0.0.1:8080";
        model = "local-model";
        api_key.clear();
        connect_timeout_ms = 5000;
        temperature = 0.3;
    }
};
