#include "TextUtils.hpp"

#include <utf8proc.h>

#include <cctype>

namespace transcache
{

namespace
{

bool isWhitespaceCodepoint(utf8proc_int32_t cp)
{
    // C0 whitespace controls and NEL carry category Cc, not Z*
    if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F) || cp == 0x85)
        return true;

    switch (utf8proc_category(cp))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

} // namespace

std::string toLowerAscii(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool isBlank(const std::string& text)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            return false;
        if (!isWhitespaceCodepoint(codepoint))
            return false;
        pos += bytes;
    }
    return true;
}

std::uint64_t hashText(const std::string& text)
{
    constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
    constexpr std::uint64_t kPrime = 1099511628211ULL;

    std::uint64_t h = kOffsetBasis;
    for (unsigned char c : text)
    {
        h ^= c;
        h *= kPrime;
    }
    return h;
}

std::string toHex64(std::uint64_t value)
{
    static const char hex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i)
    {
        out[static_cast<std::size_t>(i)] = hex[value & 0x0F];
        value >>= 4;
    }
    return out;
}

std::size_t replaceAll(std::string& s, const std::string& from, const std::string& to)
{
    if (from.empty())
        return 0;
    std::size_t pos = 0, count = 0;
    while ((pos = s.find(from, pos)) != std::string::npos)
    {
        s.replace(pos, from.size(), to);
        pos += to.size();
        ++count;
    }
    return count;
}

} // namespace transcache
