#include <catch2/catch_test_macros.hpp>
#include "transcache/cache/MemoryTranslationCache.hpp"
#include "transcache/translate/CachingTranslator.hpp"
#include "../utils/fake_translator.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace transcache;
using test_utils::FakeTranslator;

namespace {

struct Stack {
    std::shared_ptr<FakeTranslator> fake = std::make_shared<FakeTranslator>();
    MemoryTranslationCache* cache = nullptr;
    std::unique_ptr<CachingTranslator> translator;

    explicit Stack(CachingTranslator::Options options = {}, std::size_t capacity = 100)
    {
        auto owned = std::make_unique<MemoryTranslationCache>(capacity);
        cache = owned.get();
        translator = std::make_unique<CachingTranslator>(fake, std::move(owned), options);
    }
};

} // namespace

TEST_CASE("Identical source and target languages skip cache and delegate", "[translate][caching]")
{
    Stack s;
    REQUIRE(s.translator->translate("Hello", "en", "EN", TranslationContext::UI) == "Hello");
    REQUIRE(s.fake->calls() == 0);
    REQUIRE(s.cache->size() == 0);
}

TEST_CASE("Blank text is returned untouched", "[translate][caching]")
{
    Stack s;
    REQUIRE(s.translator->translate("", "en", "es", TranslationContext::UI).empty());
    REQUIRE(s.translator->translate(" \t\xC2\xA0", "en", "es", TranslationContext::UI) == " \t\xC2\xA0");
    REQUIRE(s.fake->calls() == 0);
    REQUIRE(s.cache->size() == 0);
}

TEST_CASE("A cache hit never reaches the delegate", "[translate][caching]")
{
    Stack s;
    REQUIRE(s.translator->translate("Hello", "en", "es", TranslationContext::UI) == "[es] Hello");
    REQUIRE(s.translator->translate("Hello", "EN", "ES", TranslationContext::UI) == "[es] Hello");
    REQUIRE(s.fake->calls() == 1);

    auto stats = s.translator->stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.delegate_calls == 1);

    SECTION("Context is part of the cache identity") {
        s.translator->translate("Hello", "en", "es", TranslationContext::System);
        REQUIRE(s.fake->calls() == 2);
    }
}

TEST_CASE("Failures propagate and are never cached", "[translate][caching]")
{
    Stack s;
    s.fake->failWith(ErrorKind::Transient);

    REQUIRE_THROWS_AS(s.translator->translate("Hello", "en", "es", TranslationContext::UI), TranslationError);
    REQUIRE(s.cache->size() == 0);

    s.fake->failWith(std::nullopt);
    REQUIRE(s.translator->translate("Hello", "en", "es", TranslationContext::UI) == "[es] Hello");
    REQUIRE(s.fake->calls() == 2);
    REQUIRE(s.translator->stats().failures == 1);
}

TEST_CASE("cache_failures caches the source text for unsupported languages only", "[translate][caching]")
{
    CachingTranslator::Options options;
    options.cache_failures = true;
    Stack s(options);

    SECTION("Unsupported language") {
        s.fake->failWith(ErrorKind::UnsupportedLanguage);
        try {
            s.translator->translate("Hello", "en", "xx", TranslationContext::UI);
            FAIL("expected TranslationError");
        } catch (const TranslationError& e) {
            REQUIRE(e.kind() == ErrorKind::UnsupportedLanguage);
        }
        REQUIRE(s.translator->translate("Hello", "en", "xx", TranslationContext::UI) == "Hello");
        REQUIRE(s.fake->calls() == 1);
    }

    SECTION("Transient errors are still not cached") {
        s.fake->failWith(ErrorKind::Transient);
        REQUIRE_THROWS_AS(s.translator->translate("Hello", "en", "es", TranslationContext::UI), TranslationError);
        REQUIRE(s.cache->size() == 0);
    }
}

TEST_CASE("Placeholders are masked before the delegate and restored after", "[translate][caching]")
{
    Stack s;
    s.fake->setTransform([](const std::string& text, const std::string&) {
        // reorders the two tokens the way a translator might
        const std::string open = PlaceholderMasker::kTokenOpen;
        const std::string close = PlaceholderMasker::kTokenClose;
        return open + "PH1" + close + " mensajes nuevos, hola " + open + "PH0" + close;
    });

    const std::string out =
        s.translator->translate("Hello %1$s, you have {count} new messages", "en", "es", TranslationContext::UI);

    REQUIRE(out == "{count} mensajes nuevos, hola %1$s");
    auto seen = s.fake->seen();
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].find("%1$s") == std::string::npos);
    REQUIRE(seen[0].find("{count}") == std::string::npos);
}

TEST_CASE("Placeholder protection can be turned off", "[translate][caching]")
{
    CachingTranslator::Options options;
    options.protect_placeholders = false;
    Stack s(options);

    s.translator->translate("Hi {name}", "en", "es", TranslationContext::UI);
    REQUIRE(s.fake->seen().at(0) == "Hi {name}");
}

TEST_CASE("Dropped placeholders are counted", "[translate][caching]")
{
    Stack s;
    s.fake->setTransform([](const std::string&, const std::string&) { return std::string("Hola"); });
    REQUIRE(s.translator->translate("Hi {name}", "en", "es", TranslationContext::UI) == "Hola");
    REQUIRE(s.translator->stats().dropped_placeholders == 1);
}

TEST_CASE("Readiness and preparation pass through to the delegate", "[translate][caching]")
{
    Stack s;
    s.fake->ready_ = false;
    s.fake->prepare_result_ = PrepareResult::downloading(0.25f);

    REQUIRE_FALSE(s.translator->isReady("en", "es"));
    auto result = s.translator->prepare("en", "es");
    REQUIRE(result.state == PrepareResult::State::Downloading);
    REQUIRE(result.progress == 0.25f);
    REQUIRE(s.fake->prepare_calls_.load() == 1);
    REQUIRE(s.fake->calls() == 0);
}

TEST_CASE("clearCache empties the cache and close leaves the delegate open", "[translate][caching]")
{
    Stack s;
    s.translator->translate("a", "en", "es", TranslationContext::UI);
    s.translator->translate("b", "en", "es", TranslationContext::UI);
    REQUIRE(s.cache->size() == 2);

    s.translator->clearCache();
    REQUIRE(s.cache->size() == 0);

    s.translator->close();
    REQUIRE(s.fake->close_calls_.load() == 0);
}

TEST_CASE("Null collaborators are rejected", "[translate][caching]")
{
    REQUIRE_THROWS_AS(CachingTranslator(nullptr, std::make_unique<MemoryTranslationCache>()), std::invalid_argument);
    REQUIRE_THROWS_AS(CachingTranslator(std::make_shared<FakeTranslator>(), nullptr), std::invalid_argument);
}

TEST_CASE("Concurrent misses reach the delegate together", "[translate][caching][concurrency]")
{
    Stack s;
    s.translator->translate("Cached", "en", "es", TranslationContext::UI);
    s.fake->holdCalls();

    SECTION("Different keys are translated in parallel while hits are served") {
        std::string first;
        std::string second;
        std::thread a([&] { first = s.translator->translate("One", "en", "es", TranslationContext::UI); });
        std::thread b([&] { second = s.translator->translate("Two", "en", "es", TranslationContext::UI); });

        // Both calls are inside the delegate at once
        s.fake->waitForCalls(3);
        REQUIRE(s.translator->translate("Cached", "en", "es", TranslationContext::UI) == "[es] Cached");

        s.fake->releaseCalls();
        a.join();
        b.join();

        REQUIRE(first == "[es] One");
        REQUIRE(second == "[es] Two");
        REQUIRE(s.cache->size() == 3);
    }

    SECTION("The same key is translated twice and stored once") {
        std::string first;
        std::string second;
        std::thread a([&] { first = s.translator->translate("Same", "en", "es", TranslationContext::UI); });
        std::thread b([&] { second = s.translator->translate("Same", "en", "es", TranslationContext::UI); });

        s.fake->waitForCalls(3);
        s.fake->releaseCalls();
        a.join();
        b.join();

        REQUIRE(s.fake->calls() == 3);
        REQUIRE(first == "[es] Same");
        REQUIRE(second == "[es] Same");
        REQUIRE(s.cache->size() == 2);
        REQUIRE(s.translator->translate("Same", "en", "es", TranslationContext::UI) == "[es] Same");
        REQUIRE(s.fake->calls() == 3);
    }
}
