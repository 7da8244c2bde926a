#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace transcache
{

struct CachePolicy
{
    std::size_t max_memory_entries = 1000;
    bool persist = true;
    std::optional<std::chrono::milliseconds> ttl; // empty: entries never expire
    bool cache_failures = false;

    // Every lookup misses and nothing is stored.
    bool isNoOp() const { return max_memory_entries == 0 && !persist; }

    bool isExpired(std::chrono::system_clock::time_point stored_at, std::chrono::system_clock::time_point now) const
    {
        return ttl.has_value() && now - stored_at >= *ttl;
    }

    static CachePolicy defaults() { return CachePolicy{}; }

    static CachePolicy memoryOnly()
    {
        CachePolicy p;
        p.persist = false;
        return p;
    }

    static CachePolicy noCache()
    {
        CachePolicy p;
        p.max_memory_entries = 0;
        p.persist = false;
        return p;
    }
};

} // namespace transcache
