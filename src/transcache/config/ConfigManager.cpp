#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <fstream>
#include <sstream>

namespace transcache
{

namespace
{

constexpr long long kMaxMemoryEntries = 1000000;
constexpr long long kMaxWorkerThreads = 16;
constexpr long long kMaxTtlSeconds = 365LL * 24 * 60 * 60;

} // namespace

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
}

bool ConfigManager::load()
{
    last_error_.clear();
    config_ = LocalizerConfig{};

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        return true;
    }

    std::stringstream ss;
    ss << ifs.rdbuf();
    return parse(ss.str(), config_path_);
}

bool ConfigManager::loadFromString(const std::string& content)
{
    last_error_.clear();
    config_ = LocalizerConfig{};
    return parse(content, "<string>");
}

bool ConfigManager::parse(const std::string& content, const std::string& origin)
{
    try
    {
        toml::table root = toml::parse(content, origin);
        apply(root);
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        config_ = LocalizerConfig{};
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                            std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + origin);
        return false;
    }
}

void ConfigManager::apply(const toml::table& root)
{
    if (auto* t = root["localizer"].as_table())
        applyLocalizer(*t);
    if (auto* t = root["cache"].as_table())
        applyCache(*t);
    if (auto* t = root["backend"].as_table())
        applyBackend(*t);
    if (auto* t = root["logging"].as_table())
        applyLogging(*t);
}

void ConfigManager::applyLocalizer(const toml::table& t)
{
    if (auto v = t["source_lang"].value<std::string>(); v && !v->empty())
        config_.source_lang = *v;
    if (auto v = t["target_lang"].value<std::string>(); v && !v->empty())
        config_.target_lang = *v;

    if (auto* arr = t["supported_locales"].as_array())
    {
        config_.supported_locales.clear();
        for (const auto& node : *arr)
        {
            if (auto v = node.value<std::string>(); v && !v->empty())
                config_.supported_locales.push_back(*v);
        }
    }

    if (auto v = t["protect_placeholders"].value<bool>())
        config_.protect_placeholders = *v;

    if (auto v = t["language_match"].value<std::string>())
    {
        if (auto match = parseLanguageMatch(*v))
        {
            config_.language_match = *match;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown language_match, using exact", *v);
        }
    }

    if (auto v = t["worker_threads"].value<long long>())
        config_.worker_threads = static_cast<int>(clamped("localizer.worker_threads", *v, 1, kMaxWorkerThreads));
}

void ConfigManager::applyCache(const toml::table& t)
{
    if (auto v = t["max_memory_entries"].value<long long>())
        config_.cache.max_memory_entries =
            static_cast<std::size_t>(clamped("cache.max_memory_entries", *v, 0, kMaxMemoryEntries));
    if (auto v = t["persist"].value<bool>())
        config_.cache.persist = *v;
    if (auto v = t["path"].value<std::string>(); v && !v->empty())
        config_.cache_path = *v;
    if (auto v = t["ttl_seconds"].value<long long>())
    {
        const long long secs = clamped("cache.ttl_seconds", *v, 0, kMaxTtlSeconds);
        if (secs > 0)
            config_.cache.ttl = std::chrono::seconds(secs);
        else
            config_.cache.ttl.reset();
    }
    if (auto v = t["cache_failures"].value<bool>())
        config_.cache.cache_failures = *v;
}

void ConfigManager::applyBackend(const toml::table& t)
{
    if (auto v = t["type"].value<std::string>())
    {
        if (auto backend = parseBackend(*v))
        {
            config_.backend.backend = *backend;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown backend type, translation disabled", *v);
            config_.backend.backend = Backend::None;
        }
    }
    if (auto v = t["api_key"].value<std::string>())
        config_.backend.api_key = *v;
    if (auto v = t["base_url"].value<std::string>())
        config_.backend.base_url = *v;
    if (auto v = t["connect_timeout_ms"].value<long long>())
        config_.backend.connect_timeout_ms = static_cast<int>(clamped("backend.connect_timeout_ms", *v, 100, 60000));
    if (auto v = t["timeout_ms"].value<long long>())
        config_.backend.timeout_ms = static_cast<int>(clamped("backend.timeout_ms", *v, 1000, 300000));
    if (auto v = t["max_retries"].value<long long>())
        config_.backend.max_retries = static_cast<int>(clamped("backend.max_retries", *v, 0, 10));
}

void ConfigManager::applyLogging(const toml::table& t)
{
    if (auto v = t["level"].value<long long>())
        config_.logging.level = static_cast<int>(clamped("logging.level", *v, 0, 6));
    if (auto v = t["append"].value<bool>())
        config_.logging.append = *v;
    if (auto v = t["console"].value<bool>())
        config_.logging.console = *v;
    if (auto v = t["file"].value<std::string>(); v && !v->empty())
        config_.logging.file = *v;
}

long long ConfigManager::clamped(const char* key, long long value, long long lo, long long hi)
{
    if (value >= lo && value <= hi)
        return value;

    const long long fixed = value < lo ? lo : hi;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        std::string("Config value out of range: ") + key,
                                        std::to_string(value) + " clamped to " + std::to_string(fixed));
    return fixed;
}

} // namespace transcache
