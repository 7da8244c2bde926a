#pragma once

#include "ITranslator.hpp"
#include "../cache/TranslationCache.hpp"
#include "../processing/PlaceholderMasker.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace transcache
{

/**
 * @brief The orchestration core: cache lookup, placeholder protection, delegate call
 *
 * Owns its cache and masker for its whole lifetime. The delegate is shared
 * and never closed here; whoever assembled the stack closes it.
 *
 * The cache lock is only held inside the cache calls, never across the
 * delegate call, so unrelated translations run in parallel. Two concurrent
 * misses on the same key may both reach the delegate; the later write wins.
 */
class CachingTranslator : public ITranslator
{
public:
    struct Options
    {
        bool protect_placeholders = true;
        // Cache the source text for UnsupportedLanguage failures. Transient
        // and model failures are never cached.
        bool cache_failures = false;
    };

    struct Stats
    {
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::uint64_t delegate_calls = 0;
        std::uint64_t failures = 0;
        std::uint64_t dropped_placeholders = 0;
    };

    CachingTranslator(std::shared_ptr<ITranslator> delegate, std::unique_ptr<TranslationCache> cache);
    CachingTranslator(std::shared_ptr<ITranslator> delegate, std::unique_ptr<TranslationCache> cache,
                      Options options);

    std::string translate(const std::string& text, const std::string& src_lang, const std::string& dst_lang,
                          TranslationContext context) override;

    bool isReady(const std::string& src_lang, const std::string& dst_lang) override;
    PrepareResult prepare(const std::string& src_lang, const std::string& dst_lang) override;

    // The delegate is not ours to close.
    void close() override {}

    DownloadStateTracker* downloadState() override;

    void clearCache();

    TranslationCache& cache() { return *cache_; }
    const Options& options() const { return options_; }
    Stats stats() const;

private:
    std::string translateUncached(const std::string& text, const std::string& src_lang,
                                  const std::string& dst_lang, TranslationContext context);

    std::shared_ptr<ITranslator> delegate_;
    std::unique_ptr<TranslationCache> cache_;
    PlaceholderMasker masker_;
    Options options_;

    std::atomic<std::uint64_t> hits_{ 0 };
    std::atomic<std::uint64_t> misses_{ 0 };
    std::atomic<std::uint64_t> delegate_calls_{ 0 };
    std::atomic<std::uint64_t> failures_{ 0 };
    std::atomic<std::uint64_t> dropped_placeholders_{ 0 };
};

} // namespace transcache
