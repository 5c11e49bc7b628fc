#pragma once

#include "ITranslator.hpp"
#include "state/TranslationConfig.hpp"
#include "utils/HttpCommon.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace translate
{

/**
 * @brief Blocking client for an OpenAI-compatible chat completions endpoint.
 *
 * Works against local servers (llama.cpp, vLLM, Ollama) as well as hosted
 * ones. Failures are thrown: ConnectionError / TimeoutError for transport
 * problems, std::runtime_error for HTTP errors and unusable responses.
 */
class OpenAITranslator : public ITranslator
{
public:
    OpenAITranslator(BackendConfig cfg, int request_timeout_ms);

    bool isReady() const override;

    std::string translate(const std::string& text, const std::string& src_lang, const std::string& dst_lang,
                          const ProgressCallback& progress) override;

    // Empty string on success, otherwise a description of the failure.
    std::string testConnection() const;

    // Appends /v1/chat/completions unless the URL already names an endpoint path.
    static std::string normalizeURL(const std::string& base_url);

    static std::string buildSystemPrompt(const std::string& src_lang, const std::string& dst_lang);

    static nlohmann::json buildRequestBody(const std::string& model, double temperature, const std::string& text,
                                           const std::string& src_lang, const std::string& dst_lang);

    // Extracts choices[0].message.content; throws std::runtime_error when absent.
    static std::string parseResponse(const std::string& body);

    // Throws the exception matching a failed response.
    [[noreturn]] static void throwForResponse(const HttpResponse& resp);

private:
    std::vector<Header> buildHeaders() const;

    BackendConfig cfg_;
    int request_timeout_ms_;
};

} // namespace translate
