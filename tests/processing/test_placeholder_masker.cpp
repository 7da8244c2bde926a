#include <catch2/catch_test_macros.hpp>
#include "transcache/processing/PlaceholderMasker.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace transcache;

namespace {

const std::string kOpen = PlaceholderMasker::kTokenOpen;
const std::string kClose = PlaceholderMasker::kTokenClose;

std::string token(int n)
{
    return kOpen + "PH" + std::to_string(n) + kClose;
}

// Runs text through an identity translator and hands back what it saw.
std::string maskedForm(const PlaceholderMasker& masker, const std::string& text, std::string* restored = nullptr)
{
    std::string seen;
    std::string out = masker.translateWithProtection(text, [&](const std::string& masked) {
        seen = masked;
        return masked;
    });
    if (restored)
        *restored = out;
    return seen;
}

} // namespace

TEST_CASE("Placeholders round-trip through an identity translator", "[masker]")
{
    PlaceholderMasker masker;
    const std::vector<std::string> samples = {
        "",
        "plain text without placeholders",
        "Progress: 50%% done",
        "Hello %s, you are %d years old",
        "Value %1$s then %2$d and %-10.3f",
        "Welcome {name}, item {0} of {1}",
        "Path ${HOME}/bin and ${user.name}",
        "Click <b>here</b> or <a href=\"x\">there</a><br/>",
        "Mixed %s {name} ${expr} <i>tag</i> %%",
        "Unicode: café {count} naïve 日本語 %d",
    };

    for (const auto& text : samples) {
        std::string restored;
        maskedForm(masker, text, &restored);
        CHECK(restored == text);
    }
}

TEST_CASE("Every placeholder class is hidden from the translator", "[masker]")
{
    PlaceholderMasker masker;

    SECTION("Format specifiers") {
        std::string seen = maskedForm(masker, "Hello %s, %1$d and 100%%");
        REQUIRE(seen.find('%') == std::string::npos);
        REQUIRE(seen.find("Hello") != std::string::npos);
    }

    SECTION("Brace placeholders") {
        std::string seen = maskedForm(masker, "Item {0} of {total}");
        REQUIRE(seen.find('{') == std::string::npos);
        REQUIRE(seen.find("Item") != std::string::npos);
    }

    SECTION("Template expression is one token") {
        std::string seen = maskedForm(masker, "Dir ${HOME}");
        REQUIRE(seen == "Dir " + token(0));
    }

    SECTION("Markup tags") {
        std::string seen = maskedForm(masker, "<b>Bold</b>");
        REQUIRE(seen.find('<') == std::string::npos);
        REQUIRE(seen.find("Bold") != std::string::npos);
    }
}

TEST_CASE("Tokens are numbered from zero and delimited with white square brackets", "[masker]")
{
    PlaceholderMasker masker;
    std::string seen = maskedForm(masker, "A {x} B");
    REQUIRE(seen == "A " + token(0) + " B");
}

TEST_CASE("Reordered tokens are restored in their new positions", "[masker]")
{
    PlaceholderMasker masker;
    const std::string text = "Hello %1$s, you have {count} new messages";

    std::string seen;
    std::string out = masker.translateWithProtection(text, [&](const std::string& masked) {
        seen = masked;
        // format class is masked first
        return token(1) + " mensajes nuevos, hola " + token(0);
    });

    REQUIRE(seen == "Hello " + token(0) + ", you have " + token(1) + " new messages");
    REQUIRE(out == "{count} mensajes nuevos, hola %1$s");
}

TEST_CASE("Eleven or more placeholders restore without prefix collisions", "[masker]")
{
    PlaceholderMasker masker;
    std::string text;
    for (int i = 0; i < 12; ++i)
        text += "{p" + std::to_string(i) + "} ";

    std::string restored;
    std::string seen = maskedForm(masker, text, &restored);

    REQUIRE(seen.find(token(11)) != std::string::npos);
    REQUIRE(seen.find(token(10)) != std::string::npos);
    REQUIRE(restored == text);
}

TEST_CASE("Tokens dropped by the translator are reported and skipped", "[masker]")
{
    PlaceholderMasker masker;
    PlaceholderMasker::ProtectionStats stats;

    std::string out = masker.translateWithProtection(
        "Hi {name}, see <b>this</b>",
        [](const std::string& masked) {
            std::string s = masked;
            const std::string t = token(0);
            auto pos = s.find(t);
            if (pos != std::string::npos)
                s.erase(pos, t.size());
            return s;
        },
        &stats);

    // {name} is the only brace match, so it is token 0
    REQUIRE(stats.masked == 3);
    REQUIRE(stats.dropped == 1);
    REQUIRE(out == "Hi , see <b>this</b>");
}

TEST_CASE("Input already containing the token delimiter is passed through unmasked", "[masker]")
{
    PlaceholderMasker masker;
    const std::string text = "literal " + token(0) + " and {name}";
    std::string restored;
    std::string seen = maskedForm(masker, text, &restored);

    REQUIRE(seen == text);
    REQUIRE(restored == text);
}

TEST_CASE("Exceptions from the translate callback propagate", "[masker]")
{
    PlaceholderMasker masker;
    auto failing = [](const std::string&) -> std::string { throw std::runtime_error("boom"); };
    REQUIRE_THROWS_AS(masker.translateWithProtection("x {y}", failing), std::runtime_error);
}

TEST_CASE("Very long template expressions and tag attributes round-trip", "[masker]")
{
    PlaceholderMasker masker;

    SECTION("Template expression of 100 KB is one token") {
        const std::string text = "Path ${" + std::string(100000, 'a') + "} end";
        std::string restored;
        std::string seen = maskedForm(masker, text, &restored);
        REQUIRE(seen == "Path " + token(0) + " end");
        REQUIRE(restored == text);
    }

    SECTION("Tag with a 100 KB attribute is one token") {
        const std::string text = "<a href=\"" + std::string(100000, 'x') + "\">link</a>";
        std::string restored;
        std::string seen = maskedForm(masker, text, &restored);
        REQUIRE(seen == token(1) + "link" + token(0));
        REQUIRE(restored == text);
    }

    SECTION("Long unterminated runs are left as text") {
        const std::string text = "${" + std::string(100000, 'b') + " <a " + std::string(100000, 'c');
        std::string restored;
        std::string seen = maskedForm(masker, text, &restored);
        REQUIRE(seen == text);
        REQUIRE(restored == text);
    }

    SECTION("Long identifiers and digit runs do not overflow the brace and format scans") {
        const std::string text = "{" + std::string(100000, 'n') + "} %" + std::string(100000, '9') + "d";
        std::string restored;
        maskedForm(masker, text, &restored);
        REQUIRE(restored == text);
    }
}

TEST_CASE("Markup scanning follows tag shape", "[masker]")
{
    PlaceholderMasker masker;

    REQUIRE(maskedForm(masker, "a < b and c > d") == "a < b and c > d");
    REQUIRE(maskedForm(masker, "x <br/> y") == "x " + token(0) + " y");
    REQUIRE(maskedForm(masker, "<img src=\"p.png\" />") == token(0));
    REQUIRE(maskedForm(masker, "</p>") == token(0));
    REQUIRE(maskedForm(masker, "cost ${} only") == "cost ${} only");
}
