#include "CacheKey.hpp"
#include "../processing/TextUtils.hpp"

#include <functional>

namespace transcache
{

CacheKey::CacheKey(std::string source_lang, std::string target_lang, std::uint64_t content_hash,
                   TranslationContext context)
    : source_lang_(std::move(source_lang))
    , target_lang_(std::move(target_lang))
    , content_hash_(content_hash)
    , context_(context)
{
}

CacheKey CacheKey::create(const std::string& text, const std::string& source_lang, const std::string& target_lang,
                          TranslationContext context)
{
    return CacheKey(toLowerAscii(source_lang), toLowerAscii(target_lang), hashText(text), context);
}

std::string CacheKey::storageKey() const
{
    std::string key;
    key.reserve(source_lang_.size() + target_lang_.size() + 32);
    key += source_lang_;
    key += '_';
    key += target_lang_;
    key += '_';
    key += contextName(context_);
    key += '_';
    key += toHex64(content_hash_);
    return key;
}

bool CacheKey::operator==(const CacheKey& other) const
{
    return content_hash_ == other.content_hash_ && context_ == other.context_ &&
           source_lang_ == other.source_lang_ && target_lang_ == other.target_lang_;
}

} // namespace transcache
