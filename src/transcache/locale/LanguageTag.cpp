#include "LanguageTag.hpp"
#include "../processing/TextUtils.hpp"

namespace transcache
{

std::string primarySubtag(const std::string& tag)
{
    const std::size_t sep = tag.find_first_of("-_");
    return toLowerAscii(sep == std::string::npos ? tag : tag.substr(0, sep));
}

bool sameLanguage(const std::string& a, const std::string& b, LanguageMatch match)
{
    if (equalsIgnoreCase(a, b))
        return true;
    if (match == LanguageMatch::PrimarySubtag)
        return !a.empty() && primarySubtag(a) == primarySubtag(b);
    return false;
}

std::optional<LanguageMatch> parseLanguageMatch(const std::string& name)
{
    const std::string n = toLowerAscii(name);
    if (n == "exact")
        return LanguageMatch::Exact;
    if (n == "primary_subtag" || n == "primary-subtag")
        return LanguageMatch::PrimarySubtag;
    return std::nullopt;
}

const char* languageMatchName(LanguageMatch match)
{
    return match == LanguageMatch::PrimarySubtag ? "primary_subtag" : "exact";
}

std::optional<std::string> resolveSupported(const std::string& requested, const std::vector<std::string>& supported)
{
    for (const auto& tag : supported)
    {
        if (equalsIgnoreCase(tag, requested))
            return tag;
    }
    const std::string primary = primarySubtag(requested);
    if (primary.empty())
        return std::nullopt;
    for (const auto& tag : supported)
    {
        if (primarySubtag(tag) == primary)
            return tag;
    }
    return std::nullopt;
}

} // namespace transcache
