#pragma once

#include <cstdint>
#include <string>

namespace translate
{

// One logical submission; shared by every attempt made for it. 0 is never issued.
using TaskId = std::uint64_t;
inline constexpr TaskId kInvalidTaskId = 0;

struct TranslationRequest
{
    std::string text;
    std::string source_lang = "auto";
    std::string target_lang;
};

struct TranslationResult
{
    std::string source_lang; // detected code when the request asked for "auto"
    std::string text;
};

} // namespace translate
