#pragma once

#include <cstdint>
#include <string>

namespace transcache
{

// ASCII-only lower-casing; language tags and config keys never need more.
std::string toLowerAscii(const std::string& s);

bool equalsIgnoreCase(const std::string& a, const std::string& b);

// True when text is empty or every code point is Unicode whitespace.
// Malformed UTF-8 is treated as content, never as blank.
bool isBlank(const std::string& text);

// 64-bit FNV-1a over the raw bytes.
std::uint64_t hashText(const std::string& text);

// Fixed-width (16 digit) lower-case hex rendering.
std::string toHex64(std::uint64_t value);

std::size_t replaceAll(std::string& s, const std::string& from, const std::string& to);

} // namespace transcache
