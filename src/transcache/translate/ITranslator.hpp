#pragma once

#include "PrepareResult.hpp"
#include "TranslationContext.hpp"

#include <memory>
#include <optional>
#include <string>

namespace transcache
{

class DownloadStateTracker;

enum class Backend
{
    None = 0,
    Google = 1
};

const char* backendName(Backend backend);
std::optional<Backend> parseBackend(const std::string& name);

struct BackendConfig
{
    Backend backend = Backend::None;
    std::string api_key;
    std::string base_url;
    int connect_timeout_ms = 5000;
    int timeout_ms = 30000;
    int max_retries = 1;
};

// Contract every backing engine (on-device model, cloud API, custom) fulfils.
class ITranslator
{
public:
    virtual ~ITranslator() = default;

    // Throws TranslationError when no output can be produced.
    virtual std::string translate(const std::string& text, const std::string& src_lang, const std::string& dst_lang,
                                  TranslationContext context) = 0;

    // May do I/O (e.g. a model registry lookup) but does not start a download.
    virtual bool isReady(const std::string& src_lang, const std::string& dst_lang) = 0;

    // Starts whatever warm-up the pair needs; Ready right away when none is needed.
    virtual PrepareResult prepare(const std::string& src_lang, const std::string& dst_lang) = 0;

    // Releases held resources. Idempotent.
    virtual void close() = 0;

    // Progress stream for engines that download assets; nullptr otherwise.
    virtual DownloadStateTracker* downloadState() { return nullptr; }
};

// Returns nullptr for Backend::None.
std::shared_ptr<ITranslator> createTranslator(const BackendConfig& cfg);

} // namespace transcache
