#pragma once

#include "transcache/translate/DownloadStateTracker.hpp"
#include "transcache/translate/ITranslator.hpp"
#include "transcache/translate/TranslationError.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

// Scriptable in-process translator: records every call, can fail on demand
// and can hold calls at a gate until the test releases them.
class FakeTranslator : public transcache::ITranslator {
public:
    using Transform = std::function<std::string(const std::string& text, const std::string& dst)>;

    FakeTranslator()
        : transform_([](const std::string& text, const std::string& dst) { return "[" + dst + "] " + text; })
    {
    }

    std::string translate(const std::string& text, const std::string& /*src_lang*/, const std::string& dst_lang,
                          transcache::TranslationContext /*context*/) override
    {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            ++calls_;
            seen_.push_back(text);
            entered_cv_.notify_all();
            gate_cv_.wait(lock, [this] { return gate_open_; });
            if (fail_with_)
                throw transcache::TranslationError(*fail_with_, "fake failure", dst_lang);
        }
        return transform_(text, dst_lang);
    }

    bool isReady(const std::string&, const std::string&) override { return ready_; }

    transcache::PrepareResult prepare(const std::string&, const std::string&) override
    {
        ++prepare_calls_;
        return prepare_result_;
    }

    void close() override { ++close_calls_; }

    transcache::DownloadStateTracker* downloadState() override { return expose_tracker_ ? &tracker_ : nullptr; }

    void setTransform(Transform t) { transform_ = std::move(t); }

    void failWith(std::optional<transcache::ErrorKind> kind)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        fail_with_ = kind;
    }

    void holdCalls()
    {
        std::lock_guard<std::mutex> lock(mtx_);
        gate_open_ = false;
    }

    void releaseCalls()
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            gate_open_ = true;
        }
        gate_cv_.notify_all();
    }

    // Blocks until at least n calls have entered translate().
    void waitForCalls(int n)
    {
        std::unique_lock<std::mutex> lock(mtx_);
        entered_cv_.wait(lock, [this, n] { return calls_ >= n; });
    }

    int calls() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_;
    }

    std::vector<std::string> seen() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return seen_;
    }

    bool ready_ = true;
    transcache::PrepareResult prepare_result_ = transcache::PrepareResult::ready();
    std::atomic<int> prepare_calls_{0};
    std::atomic<int> close_calls_{0};
    bool expose_tracker_ = false;
    transcache::DownloadStateTracker tracker_;

private:
    mutable std::mutex mtx_;
    std::condition_variable gate_cv_;
    std::condition_variable entered_cv_;
    bool gate_open_ = true;
    int calls_ = 0;
    std::vector<std::string> seen_;
    std::optional<transcache::ErrorKind> fail_with_;
    Transform transform_;
};

} // namespace test_utils
