#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace transcache
{

struct DownloadState
{
    enum class Phase
    {
        Idle,
        Downloading,
        Complete,
        Failed
    };

    Phase phase = Phase::Idle;
    float progress = 0.0f;
    std::string language;
    std::string error;
};

const char* downloadPhaseName(DownloadState::Phase phase);

/**
 * @brief Observable stream of warm-up state transitions
 *
 * Owned by a translator that downloads assets. Observers subscribe with a
 * callback, receive the current state immediately and every transition after
 * that. Unsubscribing has no effect on the download itself.
 *
 * Listeners run on the thread that publishes the transition, outside the
 * tracker's lock, so they may call back into the tracker.
 */
class DownloadStateTracker
{
public:
    using Listener = std::function<void(const DownloadState&)>;

    std::uint64_t subscribe(Listener listener);
    void unsubscribe(std::uint64_t id);

    DownloadState current() const;

    void begin(const std::string& language);
    void progress(float fraction);
    void complete();
    void fail(const std::string& error);
    void reset();

private:
    void publish(DownloadState state);

    mutable std::mutex mtx_;
    DownloadState state_;
    std::map<std::uint64_t, Listener> listeners_;
    std::uint64_t next_id_ = 1;
};

} // namespace transcache
