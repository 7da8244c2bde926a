#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace transcache
{

/**
 * @brief Shields machine-meaningful substrings from a natural-language translator
 *
 * Format specifiers, brace placeholders, template expressions and markup tags
 * are swapped for opaque tokens before the text reaches the translator and
 * restored afterwards. Tokens have the form "⟦PH<n>⟧": the delimiters are
 * U+27E6 and U+27E7 (mathematical white square brackets), which none of the
 * placeholder classes can match and which translators pass through verbatim.
 *
 * Masking and unmasking are only reachable through translateWithProtection()
 * so that every mask is paired with exactly one unmask.
 */
class PlaceholderMasker
{
public:
    using TranslateFn = std::function<std::string(const std::string& masked_text)>;

    struct ProtectionStats
    {
        std::size_t masked = 0;  // tokens handed to the translator
        std::size_t dropped = 0; // tokens missing from the translator output
    };

    static constexpr const char* kTokenOpen = "\xE2\x9F\xA6";  // U+27E6
    static constexpr const char* kTokenClose = "\xE2\x9F\xA7"; // U+27E7

    // Never throws on its own; exceptions from translate_fn propagate untouched.
    std::string translateWithProtection(const std::string& text, const TranslateFn& translate_fn,
                                        ProtectionStats* stats = nullptr) const;

private:
    struct Placeholder
    {
        std::size_t index = 0;
        std::string token;
        std::string original;
    };

    struct MaskResult
    {
        std::string masked_text;
        std::vector<Placeholder> placeholders;
    };

    MaskResult mask(const std::string& text) const;
    std::string unmask(const std::string& masked_text, std::vector<Placeholder> placeholders,
                       std::size_t* dropped) const;

    static std::string makeToken(std::size_t index);
};

} // namespace transcache
