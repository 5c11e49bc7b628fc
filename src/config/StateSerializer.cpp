#include "StateSerializer.hpp"

#include "state/TranslationConfig.hpp"
#include "translate/Languages.hpp"
#include "utils/ErrorReporter.hpp"

#include <algorithm>
#include <string>

namespace
{

template <typename T>
T clampSetting(const char* key, T value, T lo, T hi)
{
    T clamped = std::clamp(value, lo, hi);
    if (clamped != value)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Setting '") + key + "' is out of range and was adjusted",
                                            std::to_string(value) + " -> " + std::to_string(clamped));
    }
    return clamped;
}

} // namespace

toml::table StateSerializer::serializeTranslation(const TranslationConfig& config, const BackendConfig& backend)
{
    toml::table root;

    // [translation] section
    toml::table translation;
    translation.insert("debounce_ms", config.debounce_ms);
    translation.insert("max_retries", config.max_retries);
    translation.insert("memory_error_max_retries", config.memory_error_max_retries);
    translation.insert("initial_retry_delay_ms", config.initial_retry_delay_ms);
    translation.insert("max_retry_delay_ms", config.max_retry_delay_ms);
    translation.insert("backoff_multiplier", config.backoff_multiplier);
    translation.insert("translation_timeout_ms", config.translation_timeout_ms);
    translation.insert("max_text_length", config.max_text_length);
    translation.insert("worker_threads", config.worker_threads);
    translation.insert("source_lang", config.default_source_lang);
    translation.insert("target_lang", config.default_target_lang);

    // [translation.backend] section
    toml::table be;
    be.insert("base_url", backend.base_url);
    be.insert("model", backend.model);
    be.insert("api_key", backend.api_key);
    be.insert("connect_timeout_ms", backend.connect_timeout_ms);
    be.insert("temperature", backend.temperature);
    translation.insert("backend", std::move(be));

    root.insert("translation", std::move(translation));
    return root;
}

void StateSerializer::deserializeTranslation(const toml::table& root, TranslationConfig& config,
                                             BackendConfig& backend)
{
    auto* trans = root["translation"].as_table();
    if (!trans)
        return;

    if (auto v = (*trans)["debounce_ms"].value<int>())
        config.debounce_ms = clampSetting("debounce_ms", *v, 0, 10000);
    if (auto v = (*trans)["max_retries"].value<int>())
        config.max_retries = clampSetting("max_retries", *v, 0, 10);
    if (auto v = (*trans)["memory_error_max_retries"].value<int>())
        config.memory_error_max_retries = clampSetting("memory_error_max_retries", *v, 0, 10);
    if (auto v = (*trans)["initial_retry_delay_ms"].value<int>())
        config.initial_retry_delay_ms = clampSetting("initial_retry_delay_ms", *v, 0, 600000);
    if (auto v = (*trans)["max_retry_delay_ms"].value<int>())
        config.max_retry_delay_ms = clampSetting("max_retry_delay_ms", *v, 0, 600000);
    if (auto v = (*trans)["backoff_multiplier"].value<double>())
        config.backoff_multiplier = clampSetting("backoff_multiplier", *v, 1.0, 10.0);
    if (auto v = (*trans)["translation_timeout_ms"].value<int>())
        config.translation_timeout_ms = clampSetting("translation_timeout_ms", *v, 1000, 3600000);
    if (auto v = (*trans)["max_text_length"].value<int>())
        config.max_text_length = clampSetting("max_text_length", *v, 1, 100000);
    if (auto v = (*trans)["worker_threads"].value<int>())
        config.worker_threads = clampSetting("worker_threads", *v, 0, 64);

    if (config.max_retry_delay_ms < config.initial_retry_delay_ms)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "max_retry_delay_ms is below initial_retry_delay_ms and was raised",
                                            std::to_string(config.max_retry_delay_ms) + " -> " +
                                                std::to_string(config.initial_retry_delay_ms));
        config.max_retry_delay_ms = config.initial_retry_delay_ms;
    }

    if (auto v = (*trans)["source_lang"].value<std::string>())
    {
        if (translate::isSupportedSource(*v))
            config.default_source_lang = *v;
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unsupported source language in config, keeping default",
                                                "source_lang = " + *v);
    }
    if (auto v = (*trans)["target_lang"].value<std::string>())
    {
        if (translate::isSupportedTarget(*v))
            config.default_target_lang = *v;
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unsupported target language in config, keeping default",
                                                "target_lang = " + *v);
    }

    if (auto* be = (*trans)["backend"].as_table())
    {
        if (auto v = (*be)["base_url"].value<std::string>())
            backend.base_url = *v;
        if (auto v = (*be)["model"].value<std::string>())
            backend.model = *v;
        if (auto v = (*be)["api_key"].value<std::string>())
            backend.api_key = *v;
        if (auto v = (*be)["connect_timeout_ms"].value<int>())
            backend.connect_timeout_ms = clampSetting("connect_timeout_ms", *v, 100, 120000);
        if (auto v = (*be)["temperature"].value<double>())
            backend.temperature = clampSetting("temperature", *v, 0.0, 2.0);
    }
}
