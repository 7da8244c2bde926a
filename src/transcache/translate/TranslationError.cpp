#include "TranslationError.hpp"

namespace transcache
{

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::UnsupportedLanguage:
        return "unsupported language";
    case ErrorKind::ModelUnavailable:
        return "model unavailable";
    case ErrorKind::Transient:
        return "transient failure";
    case ErrorKind::DownloadFailed:
        return "download failed";
    }
    return "unknown";
}

TranslationError::TranslationError(ErrorKind kind, const std::string& message, std::string language)
    : std::runtime_error(message)
    , kind_(kind)
    , language_(std::move(language))
{
}

} // namespace transcache
