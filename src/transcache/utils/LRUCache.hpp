#pragma once

#include <unordered_map>
#include <list>
#include <utility>
#include <cstddef>

namespace transcache::utils
{

// Count-bounded LRU map with access-order promotion.
// Not thread-safe; owners serialize access with their own lock.
// A capacity of zero stores nothing.
template <typename K, typename V>
class LRUCache
{
public:
    explicit LRUCache(std::size_t capacity = 1000)
        : capacity_(capacity)
    {
    }

    void setCapacity(std::size_t cap)
    {
        capacity_ = cap;
        trim();
    }

    std::size_t capacity() const { return capacity_; }
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    // Looks up key and promotes it to most recently used.
    V* get(const K& key)
    {
        auto it = map_.find(key);
        if (it == map_.end())
            return nullptr;
        items_.splice(items_.begin(), items_, it->second);
        return &it->second->second;
    }

    // Looks up key without touching recency.
    const V* peek(const K& key) const
    {
        auto it = map_.find(key);
        if (it == map_.end())
            return nullptr;
        return &it->second->second;
    }

    // Inserts or overwrites; returns the number of entries evicted.
    std::size_t put(const K& key, V val)
    {
        if (capacity_ == 0)
            return 0;

        auto it = map_.find(key);
        if (it != map_.end())
        {
            it->second->second = std::move(val);
            items_.splice(items_.begin(), items_, it->second);
            return 0;
        }
        items_.emplace_front(key, std::move(val));
        map_[items_.front().first] = items_.begin();
        return trim();
    }

    bool erase(const K& key)
    {
        auto it = map_.find(key);
        if (it == map_.end())
            return false;
        items_.erase(it->second);
        map_.erase(it);
        return true;
    }

    void clear()
    {
        items_.clear();
        map_.clear();
    }

private:
    std::size_t trim()
    {
        std::size_t evicted = 0;
        while (items_.size() > capacity_)
        {
            auto last = items_.end();
            --last;
            map_.erase(last->first);
            items_.pop_back();
            ++evicted;
        }
        return evicted;
    }

    std::size_t capacity_;
    std::list<std::pair<K, V>> items_;
    std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> map_;
};

} // namespace transcache::utils
