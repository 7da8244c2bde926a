#pragma once

#include <cstddef>
#include <string>

namespace transcache::helpers
{

// Backend-specific request size limits (in bytes)
struct LengthLimits
{
    static constexpr std::size_t GOOGLE_FREE_API_MAX = 500; // URL length limit
    static constexpr std::size_t GOOGLE_PAID_API_MAX = 10000;
};

// Adds 2 seconds per 100 bytes of text on top of the base timeout.
inline int calculate_adaptive_timeout(int base_timeout_ms, std::size_t text_length)
{
    const int extra_ms = static_cast<int>((text_length / 100) * 2000);
    return base_timeout_ms + extra_ms;
}

struct LengthCheckResult
{
    bool ok = false;
    std::string error_message;
    std::size_t byte_size = 0;
};

inline LengthCheckResult check_text_length(const std::string& text, std::size_t max_length, const char* backend_name)
{
    LengthCheckResult result;
    result.byte_size = text.size();

    if (text.empty())
    {
        result.error_message = "Empty text";
        return result;
    }

    if (result.byte_size > max_length)
    {
        result.error_message = std::string(backend_name) + " text too long: " + std::to_string(result.byte_size) +
                               " bytes (limit: " + std::to_string(max_length) + " bytes)";
        return result;
    }

    result.ok = true;
    return result;
}

enum class HttpErrorType
{
    Success,
    Timeout,
    PayloadTooLarge,
    UriTooLong,
    NetworkError,
    ServerError,
    ClientError,
    Other
};

inline HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
    {
        return HttpErrorType::Success;
    }

    switch (status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 413:
        return HttpErrorType::PayloadTooLarge;
    case 414:
        return HttpErrorType::UriTooLong;
    case 400:
    case 401:
    case 403:
    case 404:
        return HttpErrorType::ClientError;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        return HttpErrorType::Other;
    }
}

inline std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet)
{
    switch (type)
    {
    case HttpErrorType::Timeout:
        return "Request timeout";
    case HttpErrorType::PayloadTooLarge:
        return "HTTP 413 Payload Too Large - text exceeds API limits";
    case HttpErrorType::UriTooLong:
        return "HTTP 414 URI Too Long - text too long for URL";
    case HttpErrorType::NetworkError:
        return "Network error: " + text_snippet;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    default:
        return "HTTP " + std::to_string(status_code) + ": " + text_snippet;
    }
}

} // namespace transcache::helpers
