#include "DownloadStateTracker.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <vector>

namespace transcache
{

const char* downloadPhaseName(DownloadState::Phase phase)
{
    switch (phase)
    {
    case DownloadState::Phase::Idle:
        return "idle";
    case DownloadState::Phase::Downloading:
        return "downloading";
    case DownloadState::Phase::Complete:
        return "complete";
    case DownloadState::Phase::Failed:
        return "failed";
    }
    return "idle";
}

std::uint64_t DownloadStateTracker::subscribe(Listener listener)
{
    if (!listener)
        return 0;

    DownloadState snapshot;
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = next_id_++;
        listeners_.emplace(id, listener);
        snapshot = state_;
    }
    listener(snapshot);
    return id;
}

void DownloadStateTracker::unsubscribe(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(mtx_);
    listeners_.erase(id);
}

DownloadState DownloadStateTracker::current() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

void DownloadStateTracker::begin(const std::string& language)
{
    DownloadState s;
    s.phase = DownloadState::Phase::Downloading;
    s.progress = 0.0f;
    s.language = language;
    publish(std::move(s));
}

void DownloadStateTracker::progress(float fraction)
{
    DownloadState s = current();
    if (s.phase != DownloadState::Phase::Downloading)
        return;
    s.progress = std::clamp(fraction, 0.0f, 1.0f);
    publish(std::move(s));
}

void DownloadStateTracker::complete()
{
    DownloadState s = current();
    s.phase = DownloadState::Phase::Complete;
    s.progress = 1.0f;
    s.error.clear();
    publish(std::move(s));
}

void DownloadStateTracker::fail(const std::string& error)
{
    DownloadState s = current();
    s.phase = DownloadState::Phase::Failed;
    s.error = error;
    publish(std::move(s));
}

void DownloadStateTracker::reset() { publish(DownloadState{}); }

void DownloadStateTracker::publish(DownloadState state)
{
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = state;
        targets.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_)
        {
            targets.push_back(listener);
        }
    }

    PLOG_DEBUG << "Model download " << downloadPhaseName(state.phase) << " [" << state.language << "] "
               << static_cast<int>(state.progress * 100.0f) << "%";

    for (const auto& listener : targets)
    {
        listener(state);
    }
}

} // namespace transcache
