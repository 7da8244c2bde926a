#pragma once

#include <vector>
#include <mutex>
#include <iterator>
#include <utility>
#include <cstddef>

namespace transcache::utils
{

// Mutex-guarded hand-off buffer between worker threads and a consumer.
template <typename T>
class PendingQueue
{
public:
    void push(T&& item)
    {
        std::lock_guard<std::mutex> lock(m_);
        q_.push_back(std::move(item));
    }

    // Moves every pending item to the end of out; returns how many were moved.
    std::size_t drain(std::vector<T>& out)
    {
        std::lock_guard<std::mutex> lock(m_);
        const std::size_t n = q_.size();
        out.insert(out.end(), std::make_move_iterator(q_.begin()), std::make_move_iterator(q_.end()));
        q_.clear();
        return n;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return q_.empty();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_);
        q_.clear();
    }

private:
    mutable std::mutex m_;
    std::vector<T> q_;
};

} // namespace transcache::utils
