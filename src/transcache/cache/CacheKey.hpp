#pragma once

#include "../translate/TranslationContext.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace transcache
{

// Identity of one cached translation. Holds a hash of the source text, never
// the text itself, so keys stay bounded in size.
class CacheKey
{
public:
    static CacheKey create(const std::string& text, const std::string& source_lang, const std::string& target_lang,
                           TranslationContext context);

    const std::string& sourceLang() const { return source_lang_; }
    const std::string& targetLang() const { return target_lang_; }
    std::uint64_t contentHash() const { return content_hash_; }
    TranslationContext context() const { return context_; }

    // "{src}_{dst}_{CONTEXT}_{hash}"; not reversible to the source text.
    std::string storageKey() const;

    bool operator==(const CacheKey& other) const;
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    CacheKey(std::string source_lang, std::string target_lang, std::uint64_t content_hash,
             TranslationContext context);

    std::string source_lang_;
    std::string target_lang_;
    std::uint64_t content_hash_ = 0;
    TranslationContext context_ = TranslationContext::UI;
};

} // namespace transcache
