#pragma once

#include <optional>
#include <string>
#include <vector>

namespace transcache
{

enum class LanguageMatch
{
    Exact,         // "en" matches "EN" only
    PrimarySubtag  // "en" also matches "en-US" and "en_GB", never "eng"
};

// "en-US" -> "en", "zh_Hant_TW" -> "zh"; lower-cased
std::string primarySubtag(const std::string& tag);

bool sameLanguage(const std::string& a, const std::string& b, LanguageMatch match);

std::optional<LanguageMatch> parseLanguageMatch(const std::string& name);
const char* languageMatchName(LanguageMatch match);

// Picks the entry of supported that best serves requested: an exact
// case-insensitive hit first, then a primary-subtag hit.
std::optional<std::string> resolveSupported(const std::string& requested, const std::vector<std::string>& supported);

} // namespace transcache
