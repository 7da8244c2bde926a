#pragma once

#include <stdexcept>
#include <string>

namespace transcache
{

enum class ErrorKind
{
    UnsupportedLanguage, // delegate cannot map the tag; never retried
    ModelUnavailable,    // pair not prepared yet; resolvable through prepare()
    Transient,           // network or runtime failure during translate
    DownloadFailed       // warm-up failed; carried by PrepareResult
};

const char* errorKindName(ErrorKind kind);

class TranslationError : public std::runtime_error
{
public:
    TranslationError(ErrorKind kind, const std::string& message, std::string language = {});

    ErrorKind kind() const noexcept { return kind_; }

    // Language tag the failure refers to; may be empty.
    const std::string& language() const noexcept { return language_; }

private:
    ErrorKind kind_;
    std::string language_;
};

} // namespace transcache
