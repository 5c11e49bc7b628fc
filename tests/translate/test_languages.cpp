#include <catch2/catch_test_macros.hpp>

#include "translate/Languages.hpp"
#include "translate/ScriptLanguageDetector.hpp"
#include "translate/TextUtils.hpp"

using namespace translate;

TEST_CASE("Language registry", "[translate][languages]") {
    REQUIRE(supportedLanguages().size() == 11);
    REQUIRE(supportedLanguages().front().code == "auto");

    REQUIRE(isSupportedSource("auto"));
    REQUIRE(isSupportedSource("ko"));
    REQUIRE_FALSE(isSupportedSource("xx"));
    REQUIRE_FALSE(isSupportedSource(""));

    REQUIRE(isSupportedTarget("en"));
    REQUIRE_FALSE(isSupportedTarget("auto"));

    REQUIRE(languageName("ja") == "Japanese");
    REQUIRE(languageName("tlh") == "tlh");
    REQUIRE(findLanguage("de") != nullptr);
    REQUIRE(findLanguage("de")->display_name == "Deutsch");
}

TEST_CASE("UTF-8 helpers", "[translate][text]") {
    REQUIRE(utf8Length("") == 0);
    REQUIRE(utf8Length("abc") == 3);
    REQUIRE(utf8Length("\xED\x95\x9C\xEA\xB8\x80") == 2);

    REQUIRE(isBlank(""));
    REQUIRE(isBlank(" \t\r\n"));
    REQUIRE(isBlank("\xE3\x80\x80")); // ideographic space
    REQUIRE_FALSE(isBlank(" a "));
    REQUIRE_FALSE(isBlank("\xFF"));

    REQUIRE(excerpt("short") == "short");
    REQUIRE(excerpt("abcdefghij", 4) == "abcd...");
    REQUIRE(excerpt("\xED\x95\x9C\xEA\xB8\x80\xED\x95\x9C", 2) == "\xED\x95\x9C\xEA\xB8\x80...");

    REQUIRE(utf8ToUtf32("a\xED\x95\x9C") == std::u32string{U'a', U'한'});
}

TEST_CASE("Script-based language detection", "[translate][detector]") {
    ScriptLanguageDetector detector;

    SECTION("Non-Latin scripts") {
        REQUIRE(detector.detect("\xEC\x95\x88\xEB\x85\x95\xED\x95\x98\xEC\x84\xB8\xEC\x9A\x94") == "ko"); // 안녕하세요
        REQUIRE(detector.detect("\xE3\x81\x93\xE3\x82\x93\xE3\x81\xAB\xE3\x81\xA1\xE3\x81\xAF") == "ja"); // こんにちは
        REQUIRE(detector.detect("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E\xE3\x81\xA7\xE3\x81\x99") == "ja"); // 日本語です
        REQUIRE(detector.detect("\xE4\xBD\xA0\xE5\xA5\xBD\xE4\xB8\x96\xE7\x95\x8C") == "zh");             // 你好世界
        REQUIRE(detector.detect("\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82 \xD0\xBC\xD0\xB8\xD1\x80") ==
                "ru"); // Привет мир
    }

    SECTION("Latin scripts vote on stop words") {
        REQUIRE(detector.detect("Hello, how are you today?") == "en");
        REQUIRE(detector.detect("Hola, gracias por todo y muy bien") == "es");
        REQUIRE(detector.detect("Bonjour, je suis avec vous et merci") == "fr");
        REQUIRE(detector.detect("Hallo, ich bin nicht sehr gut und danke") == "de");
        REQUIRE(detector.detect("Ciao, grazie molto per questo") == "it");
        REQUIRE(detector.detect("Xyzzy plugh") == "en");
    }

    SECTION("Too little text is undetectable") {
        REQUIRE_FALSE(detector.detect("").has_value());
        REQUIRE_FALSE(detector.detect("  a ").has_value());
        REQUIRE_FALSE(detector.detect("12345").has_value());
    }
}
