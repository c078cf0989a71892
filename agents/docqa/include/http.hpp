#pragma once
#include <string>
#include <stdexcept>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Transport-level failure (connect, DNS, timeout); no HTTP status was received.
class HttpTransportError : public std::runtime_error {
public:
    explicit HttpTransportError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class HttpOutcome { Ok, Transient, Permanent };

// 2xx is Ok; 408, 429 and 5xx are worth retrying; anything else is Permanent.
HttpOutcome classify_status(long status);

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
