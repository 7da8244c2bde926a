#pragma once

#include "ITranslator.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace transcache
{

// Google Translate over HTTP. Uses the v2 API when an API key is configured
// and falls back to the keyless endpoint once the paid API fails.
// Requests run synchronously on the calling thread; concurrent calls are fine.
// Remote, so always ready and prepare() short-circuits to Ready.
class GoogleTranslator : public ITranslator
{
public:
    explicit GoogleTranslator(BackendConfig cfg);
    ~GoogleTranslator() override;

    std::string translate(const std::string& text, const std::string& src_lang, const std::string& dst_lang,
                          TranslationContext context) override;
    bool isReady(const std::string& src_lang, const std::string& dst_lang) override;
    PrepareResult prepare(const std::string& src_lang, const std::string& dst_lang) override;
    void close() override;

    // BCP 47 tag -> Google language code; nullopt when unsupported.
    static std::optional<std::string> normalizeLanguageCode(const std::string& tag);

    // Response body parsers; empty result means the body was not understood.
    static std::string parseFreeResponse(const std::string& body);
    static std::string parsePaidResponse(const std::string& body);

private:
    bool doRequest(const std::string& text, const std::string& src, const std::string& dst, std::string& out_text,
                   std::string& error);
    bool tryPaidAPI(const std::string& text, const std::string& src, const std::string& dst, std::string& out_text,
                    std::string& error);
    bool tryFreeAPI(const std::string& text, const std::string& src, const std::string& dst, std::string& out_text,
                    std::string& error);

    BackendConfig cfg_;
    std::string paid_url_;
    std::string free_url_;
    std::atomic<bool> running_{ true };
    std::atomic<bool> paid_api_working_{ true };
    std::atomic<bool> warned_about_fallback_{ false };
};

} // namespace transcache
