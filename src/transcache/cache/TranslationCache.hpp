#pragma once

#include "CacheKey.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace transcache
{

struct CacheEntry
{
    std::string value;
    std::chrono::system_clock::time_point stored_at;
    std::chrono::system_clock::time_point last_access;
};

// Key/value store for finished translations. Every operation is safe to
// call concurrently from any number of threads.
class TranslationCache
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    virtual ~TranslationCache() = default;

    virtual std::optional<std::string> get(const CacheKey& key) = 0;

    // Overwrites an existing entry silently.
    virtual void put(const CacheKey& key, const std::string& value) = 0;

    // No-op when the key is absent.
    virtual void remove(const CacheKey& key) = 0;

    virtual void clear() = 0;

    virtual std::size_t size() const = 0;
};

} // namespace transcache
