#pragma once

#include "../cache/CachePolicy.hpp"
#include "../locale/LanguageTag.hpp"
#include "../translate/ITranslator.hpp"

#include <string>
#include <vector>

namespace transcache
{

struct LoggingConfig
{
    int level = 4; // plog::info
    bool append = true;
    bool console = false;
    std::string file = "logs/transcache.log";
};

// Everything a Localizer needs; filled from config.toml by ConfigManager.
struct LocalizerConfig
{
    std::string source_lang = "en";
    std::string target_lang = "en";
    std::vector<std::string> supported_locales;
    bool protect_placeholders = true;
    LanguageMatch language_match = LanguageMatch::Exact;
    int worker_threads = 2;

    CachePolicy cache;
    std::string cache_path = "cache/translations.json";

    BackendConfig backend;
    LoggingConfig logging;
};

} // namespace transcache
