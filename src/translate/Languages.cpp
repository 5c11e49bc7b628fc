#include "Languages.hpp"

namespace translate
{

const std::vector<LanguageInfo>& supportedLanguages()
{
    static const std::vector<LanguageInfo> languages = {
        { "auto", "Auto Detect", "Auto Detect" },
        { "ko", "Korean", "\xED\x95\x9C\xEA\xB5\xAD\xEC\x96\xB4" },       // 한국어
        { "en", "English", "English" },
        { "ja", "Japanese", "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E" },     // 日本語
        { "zh", "Chinese", "\xE4\xB8\xAD\xE6\x96\x87" },                 // 中文
        { "es", "Spanish", "Espa\xC3\xB1ol" },
        { "fr", "French", "Fran\xC3\xA7" "ais" },
        { "de", "German", "Deutsch" },
        { "ru", "Russian", "\xD0\xA0\xD1\x83\xD1\x81\xD1\x81\xD0\xBA\xD0\xB8\xD0\xB9" }, // Русский
        { "pt", "Portuguese", "Portugu\xC3\xAAs" },
        { "it", "Italian", "Italiano" },
    };
    return languages;
}

const LanguageInfo* findLanguage(std::string_view code)
{
    for (const auto& lang : supportedLanguages())
    {
        if (lang.code == code)
            return &lang;
    }
    return nullptr;
}

bool isSupportedSource(std::string_view code)
{
    return findLanguage(code) != nullptr;
}

bool isSupportedTarget(std::string_view code)
{
    return code != kAutoDetect && findLanguage(code) != nullptr;
}

std::string languageName(std::string_view code)
{
    if (const auto* lang = findLanguage(code))
        return std::string(lang->name);
    return std::string(code);
}

} // namespace translate
