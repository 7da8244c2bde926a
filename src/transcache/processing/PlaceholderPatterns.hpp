#pragma once

#include <array>
#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace transcache::placeholder_rules
{

enum class PlaceholderClass
{
    FormatSpecifier, // %s, %1$s, %,d, %.2f, %%
    Brace,           // {name}, {user_id}, {0}
    Template,        // ${name}, ${user.name}
    Markup           // <b>, </b>, <br/>, <a href="#">
};

struct Span
{
    std::size_t pos = 0;
    std::size_t len = 0;
};

// Regex repetition is bounded everywhere: std::regex recurses per repeated
// character, so open-ended classes are scanned by hand below.

// printf/java.util.Formatter style: optional N$ index, flags, width, precision, conversion
inline const std::regex& formatSpecifierPattern()
{
    static const std::regex re(R"(%(\d{1,9}\$)?[,+\-# 0(]{0,8}\d{0,9}\.?\d{0,9}[diouxXeEfFgGaAcsStTbBhHnp%])");
    return re;
}

inline const std::regex& bracePattern()
{
    static const std::regex re(R"(\{(?:[a-zA-Z_][a-zA-Z0-9_]{0,127}|\d{1,9})\})");
    return re;
}

inline std::vector<Span> regexSpans(const std::string& text, const std::regex& re)
{
    std::vector<Span> spans;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it)
    {
        if (it->length(0) == 0)
            continue;
        spans.push_back(Span{ static_cast<std::size_t>(it->position(0)), static_cast<std::size_t>(it->length(0)) });
    }
    return spans;
}

inline std::vector<Span> formatSpecifierSpans(const std::string& text)
{
    return regexSpans(text, formatSpecifierPattern());
}

inline std::vector<Span> braceSpans(const std::string& text)
{
    return regexSpans(text, bracePattern());
}

// "${" followed by at least one character and the first "}"
inline std::vector<Span> templateSpans(const std::string& text)
{
    std::vector<Span> spans;
    std::size_t from = 0;
    while (true)
    {
        const std::size_t open = text.find("${", from);
        if (open == std::string::npos)
            break;
        const std::size_t close = text.find('}', open + 2);
        if (close == std::string::npos)
            break;
        if (close == open + 2)
        {
            from = open + 1;
            continue;
        }
        spans.push_back(Span{ open, close + 1 - open });
        from = close + 1;
    }
    return spans;
}

inline bool isAsciiAlpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool isAsciiAlnum(char c)
{
    return isAsciiAlpha(c) || (c >= '0' && c <= '9');
}

inline bool isTagSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Opening tags with optional attributes, closing tags and self-closing tags
inline std::vector<Span> markupSpans(const std::string& text)
{
    std::vector<Span> spans;
    const std::size_t n = text.size();
    std::size_t from = 0;
    while (true)
    {
        const std::size_t lt = text.find('<', from);
        if (lt == std::string::npos)
            break;

        std::size_t i = lt + 1;
        if (i < n && text[i] == '/')
            ++i;
        if (i >= n || !isAsciiAlpha(text[i]))
        {
            from = lt + 1;
            continue;
        }
        while (i < n && isAsciiAlnum(text[i]))
            ++i;

        std::size_t gt = std::string::npos;
        if (i < n && text[i] == '>')
            gt = i;
        else if (i + 1 < n && text[i] == '/' && text[i + 1] == '>')
            gt = i + 1;
        else if (i < n && isTagSpace(text[i]))
        {
            gt = text.find('>', i);
            // no '>' left means no later tag can close either
            if (gt == std::string::npos)
                break;
        }

        if (gt == std::string::npos)
        {
            from = lt + 1;
            continue;
        }
        spans.push_back(Span{ lt, gt + 1 - lt });
        from = gt + 1;
    }
    return spans;
}

struct Rule
{
    PlaceholderClass cls;
    std::vector<Span> (*scan)(const std::string&);
};

// Scan order; earlier classes win on overlap.
inline const std::array<Rule, 4>& orderedRules()
{
    static const std::array<Rule, 4> rules{ {
        { PlaceholderClass::FormatSpecifier, &formatSpecifierSpans },
        { PlaceholderClass::Brace,           &braceSpans           },
        { PlaceholderClass::Template,        &templateSpans        },
        { PlaceholderClass::Markup,          &markupSpans          },
    } };
    return rules;
}

} // namespace transcache::placeholder_rules
