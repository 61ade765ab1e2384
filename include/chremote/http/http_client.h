#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <chremote/core/status.h>

namespace chremote::http {

struct HttpClientResponse {
    int status = 0;
    std::string body;
    std::string content_type;
};

class HttpClient {
public:
    // Thread-safe: each call uses a local io_context.
    static chremote::Result<HttpClientResponse> Get(
        std::string host,
        std::string port,
        std::string target,
        std::chrono::milliseconds timeout);

    static chremote::Result<HttpClientResponse> Post(
        std::string host,
        std::string port,
        std::string target,
        std::string body,
        std::string_view content_type,
        std::chrono::milliseconds timeout);
};

} // namespace chremote::http
