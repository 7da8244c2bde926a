#include "CachingTranslator.hpp"
#include "../processing/TextUtils.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace transcache
{

CachingTranslator::CachingTranslator(std::shared_ptr<ITranslator> delegate, std::unique_ptr<TranslationCache> cache)
    : CachingTranslator(std::move(delegate), std::move(cache), Options{})
{
}

CachingTranslator::CachingTranslator(std::shared_ptr<ITranslator> delegate, std::unique_ptr<TranslationCache> cache,
                                     Options options)
    : delegate_(std::move(delegate))
    , cache_(std::move(cache))
    , options_(options)
{
    if (!delegate_)
        throw std::invalid_argument("CachingTranslator requires a delegate translator");
    if (!cache_)
        throw std::invalid_argument("CachingTranslator requires a cache");
}

std::string CachingTranslator::translate(const std::string& text, const std::string& src_lang,
                                         const std::string& dst_lang, TranslationContext context)
{
    if (equalsIgnoreCase(src_lang, dst_lang))
        return text;

    if (isBlank(text))
        return text;

    const CacheKey key = CacheKey::create(text, src_lang, dst_lang, context);
    if (auto cached = cache_->get(key))
    {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return *cached;
    }
    misses_.fetch_add(1, std::memory_order_relaxed);

    std::string translated;
    try
    {
        translated = translateUncached(text, src_lang, dst_lang, context);
    }
    catch (const TranslationError& e)
    {
        failures_.fetch_add(1, std::memory_order_relaxed);
        if (options_.cache_failures && e.kind() == ErrorKind::UnsupportedLanguage)
        {
            PLOG_DEBUG << "Caching source text for unsupported pair " << src_lang << " -> " << dst_lang;
            cache_->put(key, text);
        }
        throw;
    }

    cache_->put(key, translated);
    return translated;
}

std::string CachingTranslator::translateUncached(const std::string& text, const std::string& src_lang,
                                                 const std::string& dst_lang, TranslationContext context)
{
    if (!options_.protect_placeholders)
    {
        delegate_calls_.fetch_add(1, std::memory_order_relaxed);
        return delegate_->translate(text, src_lang, dst_lang, context);
    }

    PlaceholderMasker::ProtectionStats protection;
    std::string result = masker_.translateWithProtection(
        text,
        [&](const std::string& masked) {
            delegate_calls_.fetch_add(1, std::memory_order_relaxed);
            return delegate_->translate(masked, src_lang, dst_lang, context);
        },
        &protection);

    if (protection.dropped > 0)
    {
        dropped_placeholders_.fetch_add(protection.dropped, std::memory_order_relaxed);
        PLOG_WARNING << "Translation [" << src_lang << " -> " << dst_lang << "] lost " << protection.dropped
                     << " placeholder(s)";
    }
    return result;
}

bool CachingTranslator::isReady(const std::string& src_lang, const std::string& dst_lang)
{
    return delegate_->isReady(src_lang, dst_lang);
}

PrepareResult CachingTranslator::prepare(const std::string& src_lang, const std::string& dst_lang)
{
    return delegate_->prepare(src_lang, dst_lang);
}

DownloadStateTracker* CachingTranslator::downloadState() { return delegate_->downloadState(); }

void CachingTranslator::clearCache() { cache_->clear(); }

CachingTranslator::Stats CachingTranslator::stats() const
{
    Stats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.delegate_calls = delegate_calls_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    s.dropped_placeholders = dropped_placeholders_.load(std::memory_order_relaxed);
    return s;
}

} // namespace transcache
