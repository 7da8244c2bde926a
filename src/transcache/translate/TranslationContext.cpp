#include "TranslationContext.hpp"
#include "../processing/TextUtils.hpp"

namespace transcache
{

const char* contextName(TranslationContext context)
{
    switch (context)
    {
    case TranslationContext::UI:
        return "UI";
    case TranslationContext::Backend:
        return "BACKEND";
    case TranslationContext::UserContent:
        return "USER_CONTENT";
    case TranslationContext::System:
        return "SYSTEM";
    }
    return "UI";
}

std::optional<TranslationContext> parseContext(const std::string& name)
{
    const std::string n = toLowerAscii(name);
    if (n == "ui")
        return TranslationContext::UI;
    if (n == "backend")
        return TranslationContext::Backend;
    if (n == "user_content" || n == "user")
        return TranslationContext::UserContent;
    if (n == "system")
        return TranslationContext::System;
    return std::nullopt;
}

} // namespace transcache
