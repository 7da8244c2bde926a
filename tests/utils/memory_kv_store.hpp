#pragma once

#include "transcache/cache/CacheError.hpp"
#include "transcache/cache/IKeyValueStore.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace test_utils {

// Map-backed key-value store whose reads and writes can be made to fail.
class MemoryKeyValueStore : public transcache::IKeyValueStore {
public:
    std::optional<std::string> read(const std::string& key) override
    {
        ++reads_;
        if (fail_reads_)
            throw transcache::CacheError("simulated read failure");
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = data_.find(key);
        if (it == data_.end())
            return std::nullopt;
        return it->second;
    }

    std::map<std::string, std::string> readAll() override
    {
        if (fail_reads_)
            throw transcache::CacheError("simulated read failure");
        std::lock_guard<std::mutex> lock(mtx_);
        return data_;
    }

    void write(const std::string& key, const std::string& value) override
    {
        if (fail_writes_)
            throw transcache::CacheError("simulated write failure");
        std::lock_guard<std::mutex> lock(mtx_);
        data_[key] = value;
    }

    void remove(const std::string& key) override
    {
        if (fail_writes_)
            throw transcache::CacheError("simulated write failure");
        std::lock_guard<std::mutex> lock(mtx_);
        data_.erase(key);
    }

    void clear() override
    {
        if (fail_writes_)
            throw transcache::CacheError("simulated write failure");
        std::lock_guard<std::mutex> lock(mtx_);
        data_.clear();
    }

    std::size_t count() override
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return data_.size();
    }

    std::atomic<bool> fail_reads_{false};
    std::atomic<bool> fail_writes_{false};
    std::atomic<int> reads_{0};

private:
    std::mutex mtx_;
    std::map<std::string, std::string> data_;
};

} // namespace test_utils
