#pragma once

#include <optional>
#include <string>

namespace transcache
{

// Provenance of a piece of text; part of the cache identity.
enum class TranslationContext
{
    UI,          // interface labels, short, often with placeholders
    Backend,     // API responses, server messages
    UserContent, // comments, posts, messages
    System       // errors, notifications
};

// "UI", "BACKEND", "USER_CONTENT", "SYSTEM"
const char* contextName(TranslationContext context);

// Accepts the canonical names and the short CLI forms, case-insensitively.
std::optional<TranslationContext> parseContext(const std::string& name);

} // namespace transcache
