#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace translate
{

inline constexpr std::string_view kAutoDetect = "auto";

struct LanguageInfo
{
    std::string_view code;         // ISO 639-1, or "auto"
    std::string_view name;         // English name, used in model prompts
    std::string_view display_name; // native name
};

const std::vector<LanguageInfo>& supportedLanguages();

// nullptr when the code is not in the registry
const LanguageInfo* findLanguage(std::string_view code);

bool isSupportedSource(std::string_view code);
bool isSupportedTarget(std::string_view code);

// English name for prompts; falls back to the code itself for unknown codes.
std::string languageName(std::string_view code);

} // namespace translate
