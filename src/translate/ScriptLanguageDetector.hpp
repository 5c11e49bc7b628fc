#pragma once

#include "ITranslator.hpp"

#include <optional>
#include <string>

namespace translate
{

/**
 * @brief Lightweight detector based on Unicode scripts.
 *
 * Hangul -> ko, kana -> ja, Han without kana -> zh, Cyrillic -> ru. Latin text
 * is decided by a stop-word vote among en/es/fr/de/pt/it and falls back to en.
 * Returns nullopt for text with fewer than kMinLetters non-space characters.
 */
class ScriptLanguageDetector : public ILanguageDetector
{
public:
    static constexpr std::size_t kMinLetters = 3;

    std::optional<std::string> detect(const std::string& text) const override;
};

} // namespace translate
