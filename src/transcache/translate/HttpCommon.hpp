#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace transcache::http
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 30000;
    // Transfer aborts once this flips to false.
    const std::atomic<bool>* keep_running = nullptr;

    // Optional adaptive timeout based on text length
    bool use_adaptive_timeout = true;
    std::size_t text_length_hint = 0;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg);

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

std::string url_escape(const std::string& s);

} // namespace transcache::http
