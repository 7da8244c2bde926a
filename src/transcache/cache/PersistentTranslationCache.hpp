#pragma once

#include "CachePolicy.hpp"
#include "IKeyValueStore.hpp"
#include "TranslationCache.hpp"
#include "../utils/LRUCache.hpp"

#include <memory>
#include <mutex>

namespace transcache
{

/**
 * @brief Two-tier cache: LRU memory tier in front of a persistent store
 *
 * get() serves from memory, falls through to the store on a miss and
 * promotes store hits into memory. put() writes the store first and then
 * memory, so a failed write leaves both tiers unchanged. Both tiers sit
 * behind a single mutex.
 *
 * A failing store read is logged and reported as a miss so translation keeps
 * working on an unhealthy disk. Failing writes throw CacheError, as do
 * values that are not valid UTF-8.
 */
class PersistentTranslationCache : public TranslationCache
{
public:
    PersistentTranslationCache(std::shared_ptr<IKeyValueStore> store, const CachePolicy& policy);

    std::optional<std::string> get(const CacheKey& key) override;
    void put(const CacheKey& key, const std::string& value) override;
    void remove(const CacheKey& key) override;
    void clear() override;

    // Entries in the persistent tier, the source of truth.
    std::size_t size() const override;

    std::size_t memorySize() const;

    void setClock(Clock clock);

private:
    static std::string encode(const CacheEntry& entry);
    static std::optional<CacheEntry> decode(const std::string& raw);

    std::chrono::system_clock::time_point now() const;
    bool expired(const CacheEntry& entry, std::chrono::system_clock::time_point t) const;

    std::shared_ptr<IKeyValueStore> store_;
    std::optional<std::chrono::milliseconds> ttl_;

    mutable std::mutex mtx_;
    utils::LRUCache<std::string, CacheEntry> memory_;
    Clock clock_;
};

} // namespace transcache
