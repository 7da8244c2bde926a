#include "MemoryTranslationCache.hpp"

#include <plog/Log.h>

namespace transcache
{

MemoryTranslationCache::MemoryTranslationCache(std::size_t max_entries, std::optional<std::chrono::milliseconds> ttl)
    : entries_(max_entries)
    , ttl_(ttl)
{
}

MemoryTranslationCache::MemoryTranslationCache(const CachePolicy& policy)
    : MemoryTranslationCache(policy.max_memory_entries, policy.ttl)
{
}

std::optional<std::string> MemoryTranslationCache::get(const CacheKey& key)
{
    const std::string storage_key = key.storageKey();
    const auto t = now();

    std::lock_guard<std::mutex> lock(mtx_);
    CacheEntry* entry = entries_.get(storage_key);
    if (!entry)
        return std::nullopt;

    if (ttl_ && t - entry->stored_at >= *ttl_)
    {
        entries_.erase(storage_key);
        return std::nullopt;
    }

    entry->last_access = t;
    return entry->value;
}

void MemoryTranslationCache::put(const CacheKey& key, const std::string& value)
{
    const std::string storage_key = key.storageKey();
    const auto t = now();

    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t evicted = entries_.put(storage_key, CacheEntry{ value, t, t });
    if (evicted > 0)
    {
        evictions_ += evicted;
        PLOG_VERBOSE << "Memory cache evicted " << evicted << " entr" << (evicted == 1 ? "y" : "ies");
    }
}

void MemoryTranslationCache::remove(const CacheKey& key)
{
    const std::string storage_key = key.storageKey();
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.erase(storage_key);
}

void MemoryTranslationCache::clear()
{
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
}

std::size_t MemoryTranslationCache::size() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

std::size_t MemoryTranslationCache::capacity() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.capacity();
}

std::uint64_t MemoryTranslationCache::evictions() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return evictions_;
}

void MemoryTranslationCache::setClock(Clock clock)
{
    std::lock_guard<std::mutex> lock(mtx_);
    clock_ = std::move(clock);
}

std::chrono::system_clock::time_point MemoryTranslationCache::now() const
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (clock_)
            return clock_();
    }
    return std::chrono::system_clock::now();
}

} // namespace transcache
