#include <catch2/catch_test_macros.hpp>
#include "transcache/processing/TextUtils.hpp"

using namespace transcache;

TEST_CASE("isBlank recognizes Unicode whitespace", "[text_utils]")
{
    REQUIRE(isBlank(""));
    REQUIRE(isBlank("   \t\n\r"));
    REQUIRE(isBlank("\xC2\xA0"));          // U+00A0 no-break space
    REQUIRE(isBlank("\xE3\x80\x80 "));     // U+3000 ideographic space
    REQUIRE(isBlank("\xE2\x80\xA8"));      // U+2028 line separator
    REQUIRE_FALSE(isBlank(" a "));
    REQUIRE_FALSE(isBlank("\xE6\x97\xA5")); // 日
    REQUIRE_FALSE(isBlank("\xFF"));         // malformed counts as content
}

TEST_CASE("Case-insensitive helpers are ASCII only", "[text_utils]")
{
    REQUIRE(toLowerAscii("EN-us") == "en-us");
    REQUIRE(equalsIgnoreCase("en-US", "EN-us"));
    REQUIRE_FALSE(equalsIgnoreCase("en", "en-US"));
}

TEST_CASE("hashText is FNV-1a 64 rendered as 16 hex digits", "[text_utils]")
{
    REQUIRE(hashText("") == 14695981039346656037ULL);
    REQUIRE(toHex64(hashText("")) == "cbf29ce484222325");
    REQUIRE(toHex64(hashText("a")) == "af63dc4c8601ec8c");
    REQUIRE(toHex64(0x1ULL) == "0000000000000001");
    REQUIRE(hashText("hello") != hashText("Hello"));
}

TEST_CASE("replaceAll counts replacements", "[text_utils]")
{
    std::string s = "a-b-c";
    REQUIRE(replaceAll(s, "-", "--") == 2);
    REQUIRE(s == "a--b--c");
    REQUIRE(replaceAll(s, "", "x") == 0);
    REQUIRE(replaceAll(s, "z", "x") == 0);
}
