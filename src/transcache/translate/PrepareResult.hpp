#pragma once

#include "TranslationError.hpp"

#include <algorithm>
#include <optional>

namespace transcache
{

// Outcome of a warm-up call. Ready and Failed are terminal; Downloading is
// transient and resolves on a later poll.
struct PrepareResult
{
    enum class State
    {
        Ready,
        Downloading,
        Failed
    };

    State state = State::Ready;
    float progress = 1.0f; // 0.0..1.0, meaningful while Downloading
    std::optional<TranslationError> error;

    bool isReady() const { return state == State::Ready; }
    bool isTerminal() const { return state != State::Downloading; }

    static PrepareResult ready() { return PrepareResult{}; }

    static PrepareResult downloading(float progress)
    {
        PrepareResult r;
        r.state = State::Downloading;
        r.progress = std::clamp(progress, 0.0f, 1.0f);
        return r;
    }

    static PrepareResult failed(TranslationError error)
    {
        PrepareResult r;
        r.state = State::Failed;
        r.progress = 0.0f;
        r.error = std::move(error);
        return r;
    }
};

} // namespace transcache
