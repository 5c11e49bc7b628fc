#include "translate/ScriptLanguageDetector.hpp"
#include "translate/TextUtils.hpp"

#include <plog/Log.h>
#include <utf8proc.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>
#include <unordered_set>

namespace translate
{

namespace
{

bool isHangul(uint32_t cp)
{
    return (cp >= 0xAC00u && cp <= 0xD7AFu) ||
           (cp >= 0x1100u && cp <= 0x11FFu) ||
           (cp >= 0x3130u && cp <= 0x318Fu);
}

bool isKana(uint32_t cp)
{
    return (cp >= 0x3040u && cp <= 0x30FFu) ||
           (cp >= 0x31F0u && cp <= 0x31FFu) ||
           (cp >= 0xFF66u && cp <= 0xFF9Fu);
}

bool isHan(uint32_t cp)
{
    return (cp >= 0x4E00u && cp <= 0x9FFFu) ||
           (cp >= 0x3400u && cp <= 0x4DBFu) ||
           (cp >= 0xF900u && cp <= 0xFAFFu);
}

bool isCyrillic(uint32_t cp)
{
    return cp >= 0x0400u && cp <= 0x04FFu;
}

bool isLatinLetter(uint32_t cp)
{
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') ||
           (cp >= 0x00C0u && cp <= 0x024Fu && cp != 0x00D7u && cp != 0x00F7u);
}

struct StopWords
{
    std::string_view code;
    std::unordered_set<std::string_view> words;
};

// Vote order doubles as the tie-break order.
const std::array<StopWords, 6>& stopWordTable()
{
    static const std::array<StopWords, 6> table = { {
        { "en", { "the", "and", "is", "are", "was", "of", "to", "in", "you", "that", "it", "for", "this", "with",
                  "what", "hello", "have", "not" } },
        { "es", { "el", "los", "las", "que", "y", "es", "por", "para", "una", "con", "hola", "est\xC3\xA1",
                  "pero", "muy", "del", "gracias" } },
        { "fr", { "le", "les", "et", "est", "une", "des", "pas", "je", "vous", "bonjour", "du", "avec", "nous",
                  "merci", "tr\xC3\xA8s", "dans" } },
        { "de", { "der", "die", "das", "und", "ist", "nicht", "ich", "ein", "eine", "mit", "zu", "sie", "hallo",
                  "auf", "danke", "sehr" } },
        { "pt", { "o", "os", "as", "\xC3\xA9", "um", "uma", "n\xC3\xA3o", "com", "ol\xC3\xA1", "do", "da",
                  "obrigado", "voc\xC3\xAA", "muito" } },
        { "it", { "il", "lo", "gli", "\xC3\xA8", "che", "non", "per", "ciao", "di", "sono", "grazie", "molto",
                  "della", "questo" } },
    } };
    return table;
}

void appendUtf8(std::string& out, char32_t cp)
{
    utf8proc_uint8_t buffer[4];
    utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
    if (bytes > 0)
        out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
}

std::string voteLatin(const std::u32string& text)
{
    std::array<int, 6> votes{};
    const auto& table = stopWordTable();

    auto tally = [&](const std::string& word) {
        if (word.empty())
            return;
        for (std::size_t i = 0; i < table.size(); ++i)
        {
            if (table[i].words.count(word))
                ++votes[i];
        }
    };

    std::string word;
    for (char32_t cp : text)
    {
        if (isLatinLetter(cp))
        {
            appendUtf8(word, static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp))));
        }
        else
        {
            tally(word);
            word.clear();
        }
    }
    tally(word);

    std::size_t best = 0;
    for (std::size_t i = 1; i < votes.size(); ++i)
    {
        if (votes[i] > votes[best])
            best = i;
    }
    return std::string(table[best].code);
}

} // namespace

std::optional<std::string> ScriptLanguageDetector::detect(const std::string& text) const
{
    const std::u32string cps = utf8ToUtf32(text);

    std::size_t non_space = 0;
    std::size_t hangul = 0, kana = 0, han = 0, cyrillic = 0, latin = 0;
    for (char32_t c : cps)
    {
        const auto cp = static_cast<uint32_t>(c);
        if (utf8proc_category(static_cast<utf8proc_int32_t>(cp)) == UTF8PROC_CATEGORY_ZS || cp == '\n' ||
            cp == '\r' || cp == '\t')
            continue;
        ++non_space;

        if (isHangul(cp))
            ++hangul;
        else if (isKana(cp))
            ++kana;
        else if (isHan(cp))
            ++han;
        else if (isCyrillic(cp))
            ++cyrillic;
        else if (isLatinLetter(cp))
            ++latin;
    }

    if (non_space < kMinLetters)
    {
        PLOG_WARNING << "Text too short for reliable detection";
        return std::nullopt;
    }

    const std::size_t cjk = kana + han;
    const std::size_t top = std::max({ hangul, cjk, cyrillic, latin });
    if (top == 0)
    {
        PLOG_WARNING << "Could not detect language for text: '" << excerpt(text) << "'";
        return std::nullopt;
    }

    std::string code;
    if (top == hangul)
        code = "ko";
    else if (top == cjk)
        code = kana > 0 ? "ja" : "zh";
    else if (top == cyrillic)
        code = "ru";
    else
        code = voteLatin(cps);

    PLOG_DEBUG << "Detected language: " << code << " for text: '" << excerpt(text) << "'";
    return code;
}

} // namespace translate
