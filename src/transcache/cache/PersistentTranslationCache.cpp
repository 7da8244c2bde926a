#include "PersistentTranslationCache.hpp"
#include "CacheError.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace transcache
{

namespace
{

constexpr const char* kValueField = "v";
constexpr const char* kStoredAtField = "t";

} // namespace

PersistentTranslationCache::PersistentTranslationCache(std::shared_ptr<IKeyValueStore> store,
                                                       const CachePolicy& policy)
    : store_(std::move(store))
    , ttl_(policy.ttl)
    , memory_(policy.max_memory_entries)
{
    if (!store_)
        throw CacheError("persistent cache requires a key-value store");
}

std::optional<std::string> PersistentTranslationCache::get(const CacheKey& key)
{
    const std::string storage_key = key.storageKey();
    const auto t = now();

    std::lock_guard<std::mutex> lock(mtx_);

    if (CacheEntry* hot = memory_.get(storage_key))
    {
        if (!expired(*hot, t))
        {
            hot->last_access = t;
            return hot->value;
        }
        memory_.erase(storage_key);
    }

    std::optional<std::string> raw;
    try
    {
        raw = store_->read(storage_key);
    }
    catch (const CacheError& e)
    {
        PLOG_WARNING << "Persistent cache read failed, treating as miss: " << e.what();
        return std::nullopt;
    }
    if (!raw)
        return std::nullopt;

    std::optional<CacheEntry> entry = decode(*raw);
    if (!entry)
    {
        PLOG_DEBUG << "Ignoring undecodable cache record " << storage_key;
        return std::nullopt;
    }

    if (expired(*entry, t))
    {
        try
        {
            store_->remove(storage_key);
        }
        catch (const CacheError& e)
        {
            PLOG_WARNING << "Could not drop expired cache record " << storage_key << ": " << e.what();
        }
        return std::nullopt;
    }

    entry->last_access = t;
    std::string value = entry->value;
    memory_.put(storage_key, std::move(*entry));
    return value;
}

void PersistentTranslationCache::put(const CacheKey& key, const std::string& value)
{
    const std::string storage_key = key.storageKey();
    const auto t = now();
    CacheEntry entry{ value, t, t };

    const std::string record = encode(entry);

    std::lock_guard<std::mutex> lock(mtx_);
    store_->write(storage_key, record);
    memory_.put(storage_key, std::move(entry));
}

void PersistentTranslationCache::remove(const CacheKey& key)
{
    const std::string storage_key = key.storageKey();
    std::lock_guard<std::mutex> lock(mtx_);
    store_->remove(storage_key);
    memory_.erase(storage_key);
}

void PersistentTranslationCache::clear()
{
    std::lock_guard<std::mutex> lock(mtx_);
    store_->clear();
    memory_.clear();
}

std::size_t PersistentTranslationCache::size() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return store_->count();
}

std::size_t PersistentTranslationCache::memorySize() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return memory_.size();
}

void PersistentTranslationCache::setClock(Clock clock)
{
    std::lock_guard<std::mutex> lock(mtx_);
    clock_ = std::move(clock);
}

std::chrono::system_clock::time_point PersistentTranslationCache::now() const
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (clock_)
            return clock_();
    }
    return std::chrono::system_clock::now();
}

bool PersistentTranslationCache::expired(const CacheEntry& entry, std::chrono::system_clock::time_point t) const
{
    return ttl_ && t - entry.stored_at >= *ttl_;
}

std::string PersistentTranslationCache::encode(const CacheEntry& entry)
{
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(entry.stored_at.time_since_epoch()).count();
    json record = json::object();
    record[kValueField] = entry.value;
    record[kStoredAtField] = ms;
    try
    {
        return record.dump();
    }
    catch (const json::type_error& e)
    {
        throw CacheError(std::string("cannot encode cache record: ") + e.what());
    }
}

std::optional<CacheEntry> PersistentTranslationCache::decode(const std::string& raw)
{
    json record = json::parse(raw, nullptr, false);
    if (record.is_discarded() || !record.is_object())
        return std::nullopt;

    auto value = record.find(kValueField);
    auto stored_at = record.find(kStoredAtField);
    if (value == record.end() || !value->is_string() || stored_at == record.end() || !stored_at->is_number_integer())
        return std::nullopt;

    CacheEntry entry;
    entry.value = value->get<std::string>();
    entry.stored_at = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(stored_at->get<long long>())));
    entry.last_access = entry.stored_at;
    return entry;
}

} // namespace transcache
