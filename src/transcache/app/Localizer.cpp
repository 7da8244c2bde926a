#include "Localizer.hpp"
#include "../cache/CacheError.hpp"
#include "../cache/JsonFileStore.hpp"
#include "../cache/MemoryTranslationCache.hpp"
#include "../cache/PersistentTranslationCache.hpp"
#include "../locale/LanguageTag.hpp"
#include "../locale/LocaleState.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace transcache
{

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace
{

std::unique_ptr<TranslationCache> buildCache(const LocalizerConfig& config, std::shared_ptr<IKeyValueStore> store)
{
    if (!config.cache.persist)
        return std::make_unique<MemoryTranslationCache>(config.cache);

    if (!store)
        store = std::make_shared<JsonFileStore>(config.cache_path);
    return std::make_unique<PersistentTranslationCache>(std::move(store), config.cache);
}

} // namespace

Localizer::Localizer(LocalizerConfig config, std::shared_ptr<ITranslator> delegate,
                     std::shared_ptr<ILocaleSource> locale, std::shared_ptr<IKeyValueStore> store)
    : config_(std::move(config))
    , delegate_(std::move(delegate))
{
    if (locale)
    {
        locale_ = std::move(locale);
    }
    else
    {
        own_locale_ = std::make_shared<LocaleState>(config_.target_lang, config_.supported_locales);
        locale_ = own_locale_;
    }

    if (!delegate_)
    {
        PLOG_INFO << "Localizer has no translator, text passes through unchanged";
        return;
    }

    CachingTranslator::Options options;
    options.protect_placeholders = config_.protect_placeholders;
    options.cache_failures = config_.cache.cache_failures;
    caching_ = std::make_unique<CachingTranslator>(delegate_, buildCache(config_, std::move(store)), options);

    const int threads = std::max(1, config_.worker_threads);
    workers_.reserve(static_cast<std::size_t>(threads));
    for (int i = 0; i < threads; ++i)
        workers_.emplace_back(&Localizer::workerLoop, this);

    PLOG_INFO << "Localizer ready: " << config_.source_lang << " -> " << locale_->currentLocale()
              << ", cache " << (config_.cache.persist ? config_.cache_path : std::string("in memory")) << ", "
              << threads << " worker(s)";
}

Localizer::~Localizer() { shutdown(); }

std::unique_ptr<Localizer> Localizer::create(const LocalizerConfig& config)
{
    std::shared_ptr<ITranslator> delegate;
    try
    {
        delegate = createTranslator(config.backend);
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to create translator", ex.what());
    }
    return std::make_unique<Localizer>(config, std::move(delegate));
}

std::string Localizer::translate(const std::string& text, TranslationContext context)
{
    return run(text, context).text;
}

Localizer::Outcome Localizer::run(const std::string& text, TranslationContext context)
{
    Outcome out;
    out.text = text;

    if (shut_down_.load() || !caching_)
        return out;

    const std::string target = targetLanguage();
    if (sameLanguage(config_.source_lang, target, config_.language_match))
        return out;

    try
    {
        out.text = caching_->translate(text, config_.source_lang, target, context);
    }
    catch (const TranslationError& e)
    {
        out.failed = true;
        out.error = e.what();
        PLOG_WARNING << "Translation to " << target << " failed (" << errorKindName(e.kind())
                     << "), using source text: " << e.what();
        ErrorReporter::ReportWarning(ErrorCategory::Translation, "Translation failed, showing original text",
                                     std::string(errorKindName(e.kind())) + ": " + e.what());
    }
    catch (const CacheError& e)
    {
        out.failed = true;
        out.error = e.what();
        ErrorReporter::ReportError(ErrorCategory::Cache, "Translation cache failure", e.what());
    }
    catch (const std::exception& e)
    {
        out.failed = true;
        out.error = e.what();
        ErrorReporter::ReportError(ErrorCategory::Unknown, "Unexpected translation failure", e.what());
    }

    if (out.failed)
        out.text = text;
    return out;
}

bool Localizer::isReady()
{
    if (shut_down_.load())
        return false;
    if (!caching_)
        return true;

    const std::string target = targetLanguage();
    if (sameLanguage(config_.source_lang, target, config_.language_match))
        return true;

    try
    {
        return caching_->isReady(config_.source_lang, target);
    }
    catch (const std::exception& e)
    {
        PLOG_WARNING << "Readiness check failed: " << e.what();
        return false;
    }
}

PrepareResult Localizer::prepare()
{
    if (shut_down_.load())
        return PrepareResult::failed(TranslationError(ErrorKind::ModelUnavailable, "localizer shut down"));
    if (!caching_)
        return PrepareResult::ready();

    const std::string target = targetLanguage();
    if (sameLanguage(config_.source_lang, target, config_.language_match))
        return PrepareResult::ready();

    try
    {
        PrepareResult result = caching_->prepare(config_.source_lang, target);
        if (result.state == PrepareResult::State::Failed && result.error)
        {
            ErrorReporter::ReportWarning(ErrorCategory::Translation, "Translation model not available",
                                         result.error->what());
        }
        return result;
    }
    catch (const TranslationError& e)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Translation, "Translation model not available", e.what());
        return PrepareResult::failed(e);
    }
    catch (const std::exception& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Unknown, "Unexpected failure preparing translator", e.what());
        return PrepareResult::failed(TranslationError(ErrorKind::ModelUnavailable, e.what(), target));
    }
}

bool Localizer::clearCache()
{
    if (!caching_)
        return true;
    try
    {
        caching_->clearCache();
        PLOG_INFO << "Translation cache cleared";
        return true;
    }
    catch (const CacheError& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Cache, "Failed to clear translation cache", e.what());
        return false;
    }
}

std::size_t Localizer::cacheSize() const
{
    if (!caching_)
        return 0;
    try
    {
        return caching_->cache().size();
    }
    catch (const CacheError& e)
    {
        PLOG_WARNING << "Unable to read cache size: " << e.what();
        return 0;
    }
}

bool Localizer::setTargetLanguage(const std::string& tag)
{
    if (!own_locale_)
    {
        PLOG_WARNING << "Target language is managed by an external locale source; ignoring '" << tag << "'";
        return false;
    }
    return own_locale_->setLocale(tag).has_value();
}

std::string Localizer::targetLanguage() const { return locale_->currentLocale(); }

CachingTranslator::Stats Localizer::stats() const
{
    return caching_ ? caching_->stats() : CachingTranslator::Stats{};
}

std::uint64_t Localizer::observePreparation(DownloadStateTracker::Listener listener)
{
    DownloadStateTracker* tracker = caching_ ? caching_->downloadState() : nullptr;
    if (!tracker)
        return 0;

    const std::uint64_t id = tracker->subscribe(std::move(listener));
    if (id != 0)
    {
        std::lock_guard<std::mutex> lock(observers_mtx_);
        observer_ids_.push_back(id);
    }
    return id;
}

void Localizer::stopObservingPreparation(std::uint64_t id)
{
    DownloadStateTracker* tracker = caching_ ? caching_->downloadState() : nullptr;
    if (!tracker)
        return;
    tracker->unsubscribe(id);

    std::lock_guard<std::mutex> lock(observers_mtx_);
    observer_ids_.erase(std::remove(observer_ids_.begin(), observer_ids_.end(), id), observer_ids_.end());
}

std::uint64_t Localizer::submit(const std::string& text, TranslationContext context)
{
    if (shut_down_.load())
        return 0;

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(jobs_mtx_);
        if (stopping_)
            return 0;
        id = next_job_id_++;
        if (!workers_.empty())
        {
            queue_.push_back(Job{ id, text, context });
            jobs_cv_.notify_one();
            return id;
        }
    }

    // No translator: completes on the spot
    Completed done;
    done.id = id;
    done.text = text;
    done.original_text = text;
    completed_.push(std::move(done));
    return id;
}

std::size_t Localizer::drain(std::vector<Completed>& out) { return completed_.drain(out); }

bool Localizer::cancel(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(jobs_mtx_);
    auto it = std::find_if(queue_.begin(), queue_.end(), [id](const Job& j) { return j.id == id; });
    if (it != queue_.end())
    {
        queue_.erase(it);
        return true;
    }
    if (in_flight_.count(id) != 0)
    {
        cancelled_.insert(id);
        return true;
    }
    return false;
}

void Localizer::workerLoop()
{
    for (;;)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(jobs_mtx_);
            jobs_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_)
                return;
            job = std::move(queue_.front());
            queue_.pop_front();
            in_flight_.insert(job.id);
        }

        Outcome outcome = run(job.text, job.context);

        bool discard = false;
        {
            std::lock_guard<std::mutex> lock(jobs_mtx_);
            in_flight_.erase(job.id);
            discard = cancelled_.erase(job.id) != 0;
        }
        if (discard)
        {
            PLOG_DEBUG << "Dropping result of cancelled job " << job.id;
            continue;
        }

        Completed done;
        done.id = job.id;
        done.text = std::move(outcome.text);
        done.failed = outcome.failed;
        done.original_text = std::move(job.text);
        done.error_message = std::move(outcome.error);
        completed_.push(std::move(done));
    }
}

void Localizer::shutdown()
{
    if (shut_down_.exchange(true))
        return;

    {
        std::lock_guard<std::mutex> lock(jobs_mtx_);
        stopping_ = true;
        if (!queue_.empty())
            PLOG_DEBUG << "Discarding " << queue_.size() << " pending job(s)";
        queue_.clear();
    }
    jobs_cv_.notify_all();
    for (auto& worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lock(observers_mtx_);
        DownloadStateTracker* tracker = caching_ ? caching_->downloadState() : nullptr;
        if (tracker)
        {
            for (std::uint64_t id : observer_ids_)
                tracker->unsubscribe(id);
        }
        observer_ids_.clear();
    }

    if (delegate_)
    {
        try
        {
            delegate_->close();
        }
        catch (const std::exception& e)
        {
            PLOG_WARNING << "Error closing translator: " << e.what();
        }
    }
    PLOG_INFO << "Localizer shut down";
}

} // namespace transcache
