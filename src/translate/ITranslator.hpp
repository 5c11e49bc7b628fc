#pragma once

#include <functional>
#include <optional>
#include <string>

namespace translate
{

// percentage is 0..100
using ProgressCallback = std::function<void(int percentage, const std::string& message)>;

// Blocking translation backend shared by all pool threads.
// Implementations throw on failure; ErrorClassifier turns the exception into a TranslationError.
class ITranslator
{
public:
    virtual ~ITranslator() = default;

    virtual bool isReady() const = 0;

    // Text has already been validated (non-empty, within length limits).
    virtual std::string translate(const std::string& text, const std::string& src_lang, const std::string& dst_lang,
                                  const ProgressCallback& progress) = 0;
};

class ILanguageDetector
{
public:
    virtual ~ILanguageDetector() = default;

    // ISO 639-1 code, or nullopt when the language cannot be determined.
    virtual std::optional<std::string> detect(const std::string& text) const = 0;
};

} // namespace translate
