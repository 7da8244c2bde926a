#include "PlaceholderMasker.hpp"
#include "PlaceholderPatterns.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace transcache
{

std::string PlaceholderMasker::translateWithProtection(const std::string& text, const TranslateFn& translate_fn,
                                                       ProtectionStats* stats) const
{
    MaskResult masked = mask(text);
    const std::size_t masked_count = masked.placeholders.size();

    std::string translated = translate_fn(masked.masked_text);

    std::size_t dropped = 0;
    std::string result = unmask(translated, std::move(masked.placeholders), &dropped);
    if (dropped > 0)
    {
        PLOG_DEBUG << "Translator dropped " << dropped << " of " << masked_count << " placeholder token(s)";
    }

    if (stats)
    {
        stats->masked = masked_count;
        stats->dropped = dropped;
    }
    return result;
}

PlaceholderMasker::MaskResult PlaceholderMasker::mask(const std::string& text) const
{
    MaskResult result;
    result.masked_text = text;

    if (text.empty())
        return result;

    // Text that already contains our delimiter would be mangled by unmask.
    if (text.find(kTokenOpen) != std::string::npos)
    {
        PLOG_DEBUG << "Skipping placeholder protection: input contains the token delimiter";
        return result;
    }

    std::string& current = result.masked_text;
    std::size_t next_index = 0;

    for (const auto& rule : placeholder_rules::orderedRules())
    {
        const std::vector<placeholder_rules::Span> spans = rule.scan(current);

        // Right to left so earlier offsets stay valid.
        for (auto it = spans.rbegin(); it != spans.rend(); ++it)
        {
            const placeholder_rules::Span& m = *it;

            // ${...} belongs to the template class, not to its inner braces
            if (rule.cls == placeholder_rules::PlaceholderClass::Brace && m.pos > 0 && current[m.pos - 1] == '$')
                continue;

            Placeholder ph;
            ph.index = next_index++;
            ph.token = makeToken(ph.index);
            ph.original = current.substr(m.pos, m.len);
            current.replace(m.pos, m.len, ph.token);
            result.placeholders.push_back(std::move(ph));
        }
    }

    return result;
}

std::string PlaceholderMasker::unmask(const std::string& masked_text, std::vector<Placeholder> placeholders,
                                      std::size_t* dropped) const
{
    std::string result = masked_text;

    // Descending index: restore "⟦PH10⟧" before "⟦PH1⟧".
    std::sort(placeholders.begin(), placeholders.end(),
              [](const Placeholder& a, const Placeholder& b) { return a.index > b.index; });

    std::size_t missing = 0;
    for (const auto& ph : placeholders)
    {
        if (replaceAll(result, ph.token, ph.original) == 0)
            ++missing;
    }

    if (dropped)
        *dropped = missing;
    return result;
}

std::string PlaceholderMasker::makeToken(std::size_t index)
{
    std::string token;
    token.reserve(16);
    token += kTokenOpen;
    token += "PH";
    token += std::to_string(index);
    token += kTokenClose;
    return token;
}

} // namespace transcache
