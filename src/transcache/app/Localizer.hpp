#pragma once

#include "../config/LocalizerConfig.hpp"
#include "../translate/CachingTranslator.hpp"
#include "../translate/DownloadStateTracker.hpp"
#include "../utils/PendingQueue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace transcache
{

class IKeyValueStore;
class ILocaleSource;
class LocaleState;

/**
 * @brief Application-facing entry point
 *
 * Assembles cache, caching translator and locale source from a
 * LocalizerConfig. translate() never throws: any failure is logged,
 * reported through ErrorReporter and answered with the source text.
 *
 * submit()/drain() run translations on a fixed worker pool. A job cancelled
 * before a worker picks it up never reaches the translator or the cache; a
 * job cancelled while running finishes its cache write and its result is
 * dropped.
 *
 * shutdown() stops the workers, discards pending jobs and closes the
 * backing translator. The destructor calls it.
 */
class Localizer
{
public:
    struct Completed
    {
        std::uint64_t id = 0;
        std::string text;
        bool failed = false;
        std::string original_text;
        std::string error_message;
    };

    // delegate may be null (translation disabled). Without a locale source the
    // Localizer keeps its own LocaleState seeded from the config. Without a
    // store a persistent policy writes to config.cache_path.
    Localizer(LocalizerConfig config, std::shared_ptr<ITranslator> delegate,
              std::shared_ptr<ILocaleSource> locale = nullptr, std::shared_ptr<IKeyValueStore> store = nullptr);
    ~Localizer();

    Localizer(const Localizer&) = delete;
    Localizer& operator=(const Localizer&) = delete;

    // Backend picked by config.backend.
    static std::unique_ptr<Localizer> create(const LocalizerConfig& config);

    std::string translate(const std::string& text, TranslationContext context = TranslationContext::UI);

    bool isReady();
    PrepareResult prepare();

    bool clearCache();
    std::size_t cacheSize() const;

    // Fails when the tag resolves to no supported locale or the locale is
    // owned by an external source.
    bool setTargetLanguage(const std::string& tag);
    std::string targetLanguage() const;
    const std::string& sourceLanguage() const { return config_.source_lang; }

    CachingTranslator::Stats stats() const;
    const LocalizerConfig& config() const { return config_; }

    // Subscribes to warm-up progress; 0 when the backend does not download.
    std::uint64_t observePreparation(DownloadStateTracker::Listener listener);
    void stopObservingPreparation(std::uint64_t id);

    // Returns 0 after shutdown.
    std::uint64_t submit(const std::string& text, TranslationContext context = TranslationContext::UI);
    std::size_t drain(std::vector<Completed>& out);
    bool cancel(std::uint64_t id);

    void shutdown();
    bool isShutdown() const { return shut_down_.load(); }

private:
    struct Outcome
    {
        std::string text;
        bool failed = false;
        std::string error;
    };

    struct Job
    {
        std::uint64_t id = 0;
        std::string text;
        TranslationContext context = TranslationContext::UI;
    };

    Outcome run(const std::string& text, TranslationContext context);
    void workerLoop();

    LocalizerConfig config_;
    std::shared_ptr<ITranslator> delegate_;
    std::unique_ptr<CachingTranslator> caching_;
    std::shared_ptr<ILocaleSource> locale_;
    std::shared_ptr<LocaleState> own_locale_;

    std::atomic<bool> shut_down_{ false };

    std::mutex jobs_mtx_;
    std::condition_variable jobs_cv_;
    std::deque<Job> queue_;
    std::unordered_set<std::uint64_t> in_flight_;
    std::unordered_set<std::uint64_t> cancelled_;
    std::uint64_t next_job_id_ = 1;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
    utils::PendingQueue<Completed> completed_;

    std::mutex observers_mtx_;
    std::vector<std::uint64_t> observer_ids_;
};

} // namespace transcache
