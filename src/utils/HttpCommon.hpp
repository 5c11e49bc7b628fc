#pragma once

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
    int timeout_ms = 60000;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error;      // non-empty on network/transport errors
    bool timed_out = false; // transport gave up waiting

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// JSON POST helper
HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg);

// Simple GET helper
HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

} // namespace translate
