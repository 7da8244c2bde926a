#pragma once

#include "CachePolicy.hpp"
#include "TranslationCache.hpp"
#include "../utils/LRUCache.hpp"

#include <mutex>

namespace transcache
{

// Bounded in-memory cache with access-order (LRU) eviction and optional TTL.
// One mutex covers every operation, including promotion on get and the
// evict-after-insert sequence of put.
class MemoryTranslationCache : public TranslationCache
{
public:
    explicit MemoryTranslationCache(std::size_t max_entries = 1000,
                                    std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    explicit MemoryTranslationCache(const CachePolicy& policy);

    std::optional<std::string> get(const CacheKey& key) override;
    void put(const CacheKey& key, const std::string& value) override;
    void remove(const CacheKey& key) override;
    void clear() override;
    std::size_t size() const override;

    std::size_t capacity() const;
    std::uint64_t evictions() const;

    // Test hook for TTL handling.
    void setClock(Clock clock);

private:
    std::chrono::system_clock::time_point now() const;

    mutable std::mutex mtx_;
    utils::LRUCache<std::string, CacheEntry> entries_;
    std::optional<std::chrono::milliseconds> ttl_;
    std::uint64_t evictions_ = 0;
    Clock clock_;
};

} // namespace transcache
