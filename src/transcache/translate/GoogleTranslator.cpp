#include "GoogleTranslator.hpp"
#include "HttpCommon.hpp"
#include "TranslatorHelpers.hpp"
#include "../processing/TextUtils.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <chrono>
#include <thread>
#include <unordered_set>

using json = nlohmann::json;

namespace transcache
{

namespace
{

constexpr const char* kDefaultPaidUrl = "https://translation.googleapis.com/language/translate/v2";
constexpr const char* kDefaultFreeUrl = "https://translate.googleapis.com/translate_a/single";

const std::unordered_set<std::string>& supportedCodes()
{
    static const std::unordered_set<std::string> codes{
        "af", "ar", "be", "bg", "bn", "ca", "cs", "cy", "da", "de", "el", "en", "eo", "es", "et", "fa", "fi",
        "fr", "ga", "gl", "gu", "he", "hi", "hr", "ht", "hu", "id", "is", "it", "ja", "ka", "kn", "ko", "lt",
        "lv", "mk", "mr", "ms", "mt", "nl", "no", "pl", "pt", "ro", "ru", "sk", "sl", "sq", "sv", "sw", "ta",
        "te", "th", "tl", "tr", "uk", "ur", "vi", "zh",
    };
    return codes;
}

} // namespace

GoogleTranslator::GoogleTranslator(BackendConfig cfg)
    : cfg_(std::move(cfg))
{
    cfg_.max_retries = cfg_.max_retries < 0 ? 0 : cfg_.max_retries;
    if (cfg_.base_url.empty())
    {
        paid_url_ = kDefaultPaidUrl;
        free_url_ = kDefaultFreeUrl;
    }
    else
    {
        std::string base = cfg_.base_url;
        while (!base.empty() && base.back() == '/')
            base.pop_back();
        paid_url_ = base + "/language/translate/v2";
        free_url_ = base + "/translate_a/single";
    }
}

GoogleTranslator::~GoogleTranslator() { close(); }

std::string GoogleTranslator::translate(const std::string& text, const std::string& src_lang,
                                        const std::string& dst_lang, TranslationContext context)
{
    if (!running_.load())
        throw TranslationError(ErrorKind::ModelUnavailable, "translator closed", dst_lang);

    const auto src = normalizeLanguageCode(src_lang);
    if (!src)
        throw TranslationError(ErrorKind::UnsupportedLanguage, "Unsupported source language: " + src_lang, src_lang);
    const auto dst = normalizeLanguageCode(dst_lang);
    if (!dst)
        throw TranslationError(ErrorKind::UnsupportedLanguage, "Unsupported target language: " + dst_lang, dst_lang);

    std::string out;
    std::string error;
    int attempt = 0;
    while (running_.load())
    {
        if (doRequest(text, *src, *dst, out, error))
        {
            PLOG_DEBUG << "Translation [" << *src << " -> " << *dst << ", " << contextName(context)
                       << "]: '" << text << "' -> '" << out << "'";
            return out;
        }

        if (attempt >= cfg_.max_retries)
            break;
        ++attempt;
        std::this_thread::sleep_for(std::chrono::milliseconds(200 * attempt));
    }

    if (!running_.load() && error.empty())
        error = "translator closed during request";

    PLOG_WARNING << "Translation failed [" << *src << " -> " << *dst << "]: " << error;
    throw TranslationError(ErrorKind::Transient, error, dst_lang);
}

bool GoogleTranslator::isReady(const std::string& src_lang, const std::string& dst_lang)
{
    return running_.load() && normalizeLanguageCode(src_lang) && normalizeLanguageCode(dst_lang);
}

PrepareResult GoogleTranslator::prepare(const std::string& src_lang, const std::string& dst_lang)
{
    if (!normalizeLanguageCode(src_lang))
        return PrepareResult::failed(TranslationError(ErrorKind::UnsupportedLanguage,
                                                      "Unsupported source language: " + src_lang, src_lang));
    if (!normalizeLanguageCode(dst_lang))
        return PrepareResult::failed(TranslationError(ErrorKind::UnsupportedLanguage,
                                                      "Unsupported target language: " + dst_lang, dst_lang));
    return PrepareResult::ready();
}

void GoogleTranslator::close() { running_.store(false); }

bool GoogleTranslator::doRequest(const std::string& text, const std::string& src, const std::string& dst,
                                 std::string& out_text, std::string& error)
{
    if (!cfg_.api_key.empty() && paid_api_working_.load())
    {
        if (tryPaidAPI(text, src, dst, out_text, error))
            return true;

        paid_api_working_.store(false);
        if (!warned_about_fallback_.exchange(true))
        {
            PLOG_WARNING << "Google Translate paid API failed, falling back to free tier: " << error;
        }
    }

    return tryFreeAPI(text, src, dst, out_text, error);
}

bool GoogleTranslator::tryPaidAPI(const std::string& text, const std::string& src, const std::string& dst,
                                  std::string& out_text, std::string& error)
{
    using namespace helpers;

    auto length_check = check_text_length(text, LengthLimits::GOOGLE_PAID_API_MAX, "Google Paid API");
    if (!length_check.ok)
    {
        error = length_check.error_message;
        return false;
    }

    json body = json::object();
    body["q"] = text;
    body["source"] = src;
    body["target"] = dst;
    body["format"] = "text";

    http::SessionConfig scfg;
    scfg.connect_timeout_ms = cfg_.connect_timeout_ms;
    scfg.timeout_ms = cfg_.timeout_ms;
    scfg.text_length_hint = text.size();
    scfg.keep_running = &running_;

    const std::string url = paid_url_ + "?key=" + http::url_escape(cfg_.api_key);
    auto r = http::post_json(url, body.dump(-1, ' ', false, json::error_handler_t::replace), {}, scfg);

    if (!r.error.empty())
    {
        error = get_error_description(categorize_http_error(0, r.error), 0, r.error);
        return false;
    }
    if (!r.ok())
    {
        error = get_error_description(categorize_http_error(r.status_code, ""), r.status_code, r.text);
        PLOG_DEBUG << "Google paid API response body: " << r.text;
        return false;
    }

    std::string content = parsePaidResponse(r.text);
    if (content.empty())
    {
        error = "Google paid API response parse error";
        return false;
    }
    out_text = std::move(content);
    return true;
}

bool GoogleTranslator::tryFreeAPI(const std::string& text, const std::string& src, const std::string& dst,
                                  std::string& out_text, std::string& error)
{
    using namespace helpers;

    // The free endpoint takes the text in the query string
    auto length_check = check_text_length(text, LengthLimits::GOOGLE_FREE_API_MAX, "Google Free API");
    if (!length_check.ok)
    {
        error = length_check.error_message;
        return false;
    }

    const std::string url = free_url_ + "?client=gtx&sl=" + http::url_escape(src) + "&tl=" + http::url_escape(dst) +
                            "&dt=t&q=" + http::url_escape(text);

    http::SessionConfig scfg;
    scfg.connect_timeout_ms = cfg_.connect_timeout_ms;
    scfg.timeout_ms = cfg_.timeout_ms;
    scfg.text_length_hint = text.size();
    scfg.keep_running = &running_;

    auto r = http::get(url, {}, scfg);

    if (!r.error.empty())
    {
        error = get_error_description(categorize_http_error(0, r.error), 0, r.error);
        return false;
    }
    if (!r.ok())
    {
        error = get_error_description(categorize_http_error(r.status_code, ""), r.status_code, r.text);
        return false;
    }

    std::string content = parseFreeResponse(r.text);
    if (content.empty())
    {
        error = "Google free API response parse error";
        return false;
    }
    out_text = std::move(content);
    return true;
}

std::optional<std::string> GoogleTranslator::normalizeLanguageCode(const std::string& tag)
{
    std::string t = toLowerAscii(tag);
    for (char& c : t)
    {
        if (c == '_')
            c = '-';
    }

    if (t == "zh-tw" || t == "zh-hk" || t.rfind("zh-hant", 0) == 0)
        return std::string("zh-TW");
    if (t == "iw")
        return std::string("he");
    if (t == "nb" || t == "nn")
        return std::string("no");
    if (t == "fil")
        return std::string("tl");

    const std::size_t sep = t.find('-');
    const std::string primary = sep == std::string::npos ? t : t.substr(0, sep);
    if (primary == "zh")
        return std::string("zh-CN");
    if (supportedCodes().count(primary) == 0)
        return std::nullopt;
    return primary;
}

std::string GoogleTranslator::parseFreeResponse(const std::string& body)
{
    // [[["translated","source",...],["more","..."]],null,"en",...]
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_array() || doc.empty() || !doc[0].is_array())
        return {};

    std::string out;
    for (const auto& segment : doc[0])
    {
        if (segment.is_array() && !segment.empty() && segment[0].is_string())
            out += segment[0].get<std::string>();
    }
    return out;
}

std::string GoogleTranslator::parsePaidResponse(const std::string& body)
{
    // {"data":{"translations":[{"translatedText":"..."}]}}
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return {};

    auto data = doc.find("data");
    if (data == doc.end() || !data->is_object())
        return {};
    auto translations = data->find("translations");
    if (translations == data->end() || !translations->is_array() || translations->empty())
        return {};
    const auto& first = (*translations)[0];
    if (!first.is_object() || !first.contains("translatedText") || !first["translatedText"].is_string())
        return {};
    return first["translatedText"].get<std::string>();
}

} // namespace transcache
