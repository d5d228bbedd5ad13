#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace translate
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 45000;
    const std::atomic<bool>* cancel_flag = nullptr;

    // Optional adaptive timeout based on text length
    bool use_adaptive_timeout = true;
    std::size_t text_length_hint = 0; // Set this for adaptive timeout calculation
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    bool cancelled = false;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Classifies a finished transfer. Only a transfer aborted by the cancel flag
// counts as cancelled; a response that arrived in full is kept.
HttpResponse finishResponse(int status_code, std::string text, std::string transport_error, bool aborted);

// Long-lived HTTP client owned by a translator. One instance serves every
// request of its owner so the underlying connection can be reused.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse postJson(const std::string& url, const std::string& body,
                                  const std::vector<Header>& headers, const SessionConfig& cfg) = 0;
};

class CprTransport : public HttpTransport
{
public:
    CprTransport();
    ~CprTransport() override;

    HttpResponse postJson(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                          const SessionConfig& cfg) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace translate
