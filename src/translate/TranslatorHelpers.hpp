#pragma once
#include <cctype>
#include <cstddef>
#include <string>

namespace translate
{
namespace helpers
{

// Calculate adaptive timeout based on text length
// base_timeout_ms: minimum timeout
// text_length: byte count
// Returns: timeout in milliseconds
inline int calculate_adaptive_timeout(int base_timeout_ms, std::size_t text_length)
{
    // 2 extra seconds per 100 bytes
    const int extra_ms = static_cast<int>((text_length / 100) * 2000);
    return base_timeout_ms + extra_ms;
}

inline bool is_blank(const std::string& text)
{
    for (char c : text)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

enum class HttpErrorType
{
    Success,
    Timeout,
    PayloadTooLarge,
    NetworkError,
    ServerError,
    ClientError,
    Other
};

inline HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos ||
            error_msg.find("timed out") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
        return HttpErrorType::Success;

    switch (status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 413:
        return HttpErrorType::PayloadTooLarge;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        if (status_code >= 400)
            return HttpErrorType::ClientError;
        return HttpErrorType::Other;
    }
}

inline std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet)
{
    switch (type)
    {
    case HttpErrorType::Timeout:
        if (status_code == 0)
            return "Request timeout: " + text_snippet;
        return "Request timeout (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::PayloadTooLarge:
        return "HTTP 413 Payload Too Large: " + text_snippet;
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

} // namespace helpers
} // namespace translate
