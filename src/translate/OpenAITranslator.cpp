#include "OpenAITranslator.hpp"

#include "Languages.hpp"
#include "TextUtils.hpp"
#include "TranslationError.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <stdexcept>
#include <utility>

namespace translate
{

namespace
{

void replaceAll(std::string& s, const std::string& from, const std::string& to)
{
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos)
    {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool mentionsModel(const std::string& body)
{
    return body.find("model") != std::string::npos || body.find("Model") != std::string::npos;
}

} // namespace

OpenAITranslator::OpenAITranslator(BackendConfig cfg, int request_timeout_ms)
    : cfg_(std::move(cfg))
    , request_timeout_ms_(request_timeout_ms)
{
}

bool OpenAITranslator::isReady() const
{
    return !cfg_.base_url.empty() && !cfg_.model.empty();
}

std::vector<Header> OpenAITranslator::buildHeaders() const
{
    std::vector<Header> headers{ { "Content-Type", "application/json" } };
    if (!cfg_.api_key.empty())
        headers.push_back({ "Authorization", std::string("Bearer ") + cfg_.api_key });
    return headers;
}

std::string OpenAITranslator::buildSystemPrompt(const std::string& src_lang, const std::string& dst_lang)
{
    std::string prompt = R"(You are a professional translator.
Translate the user's text from {source_lang} into {target_lang}.

Guidelines:
- Stay faithful to the source; add nothing and omit nothing.
- Keep line breaks, numbers and names as they are.
- Output the translation only, with no explanations.)";
    replaceAll(prompt, "{source_lang}", languageName(src_lang));
    replaceAll(prompt, "{target_lang}", languageName(dst_lang));
    return prompt;
}

nlohmann::json OpenAITranslator::buildRequestBody(const std::string& model, double temperature,
                                                  const std::string& text, const std::string& src_lang,
                                                  const std::string& dst_lang)
{
    nlohmann::json body = nlohmann::json::object();
    body["model"] = model;
    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({ { "role", "system" }, { "content", buildSystemPrompt(src_lang, dst_lang) } });
    messages.push_back({ { "role", "user" }, { "content", text } });
    body["messages"] = std::move(messages);
    body["temperature"] = temperature;
    body["stream"] = false;
    return body;
}

std::string OpenAITranslator::parseResponse(const std::string& body)
{
    nlohmann::json json;
    try
    {
        json = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::parse_error& ex)
    {
        throw std::runtime_error(std::string("model response failed to parse: ") + ex.what());
    }

    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty())
        throw std::runtime_error("model response failed: missing choices");

    const auto& choice = json["choices"].at(0);
    if (!choice.contains("message") || !choice["message"].contains("content") ||
        !choice["message"]["content"].is_string())
        throw std::runtime_error("model response failed: missing message content");

    return choice["message"]["content"].get<std::string>();
}

void OpenAITranslator::throwForResponse(const HttpResponse& resp)
{
    if (!resp.error.empty())
    {
        if (resp.timed_out)
            throw TimeoutError("request timed out: " + resp.error);
        throw ConnectionError("connection failed: " + resp.error);
    }

    const std::string status = "HTTP " + std::to_string(resp.status_code);
    const std::string snippet = excerpt(resp.text, 200);
    if (resp.status_code == 404 && mentionsModel(resp.text))
        throw std::runtime_error("model request failed: " + status + ": " + snippet);
    if (resp.status_code == 408 || resp.status_code == 504)
        throw TimeoutError("server timeout: " + status + ": " + snippet);
    if (resp.status_code == 502 || resp.status_code == 503)
        throw ConnectionError("server unavailable (network): " + status + ": " + snippet);
    throw std::runtime_error("translation request rejected: " + status + ": " + snippet);
}

std::string OpenAITranslator::translate(const std::string& text, const std::string& src_lang,
                                        const std::string& dst_lang, const ProgressCallback& progress)
{
    const std::string body = buildRequestBody(cfg_.model, cfg_.temperature, text, src_lang, dst_lang).dump();
    PLOG_DEBUG << "final post body: " << body;

    SessionConfig session;
    session.connect_timeout_ms = cfg_.connect_timeout_ms;
    session.timeout_ms = request_timeout_ms_;

    if (progress)
        progress(30, "Waiting for model...");

    const auto response = post_json(normalizeURL(cfg_.base_url), body, buildHeaders(), session);
    if (!response.ok())
    {
        PLOG_WARNING << "Chat completions request failed: status=" << response.status_code
                     << " error=" << response.error;
        throwForResponse(response);
    }

    if (progress)
        progress(90, "Processing response...");

    std::string translated = parseResponse(response.text);

    if (progress)
        progress(100, "Done");
    return translated;
}

std::string OpenAITranslator::testConnection() const
{
    if (cfg_.base_url.empty())
        return "Config Error: Missing base URL";
    if (cfg_.model.empty())
        return "Config Error: Missing model";

    std::string models_url = cfg_.base_url;
    while (!models_url.empty() && models_url.back() == '/')
        models_url.pop_back();
    models_url += "/v1/models";

    SessionConfig session;
    session.connect_timeout_ms = cfg_.connect_timeout_ms;
    session.timeout_ms = 8000;

    std::vector<Header> headers;
    if (!cfg_.api_key.empty())
        headers.push_back({ "Authorization", std::string("Bearer ") + cfg_.api_key });

    const auto resp = translate::get(models_url, headers, session);
    if (!resp.error.empty())
        return "Error: Cannot connect to base URL - " + resp.error;
    if (resp.status_code < 200 || resp.status_code >= 300)
        return "Error: Base URL returned HTTP " + std::to_string(resp.status_code);
    if (resp.text.find('"' + cfg_.model + '"') == std::string::npos)
        return "Warning: Model '" + cfg_.model + "' not found in available models list";
    return {};
}

std::string OpenAITranslator::normalizeURL(const std::string& base_url)
{
    std::string url = base_url;

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    if (url.empty())
        return url;

    std::size_t scheme_end = url.find("://");
    std::size_t path_start = (scheme_end != std::string::npos) ? url.find('/', scheme_end + 3) : url.find('/');

    if (path_start != std::string::npos)
    {
        std::string path = url.substr(path_start);
        if (path.find("/chat/completions") != std::string::npos)
            return url;
        if (path == "/v1")
            return url + "/chat/completions";
        return url;
    }

    return url + "/v1/chat/completions";
}

} // namespace translate
