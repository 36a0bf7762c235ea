#pragma once
#include <map>
#include <string>

namespace providers {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeout_ms = 60000;
};

struct HttpResponse {
    int status = 0;            // 0 when no HTTP response arrived
    bool timed_out = false;
    std::string network_error; // transport failure description, empty on success
    std::string body;

    bool ok() const { return network_error.empty() && !timed_out && status >= 200 && status < 300; }
};

// Blocking POST transport used by the provider adapters.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

// Qt Network implementation. Each call runs its own QNetworkAccessManager and
// event loop in the calling thread, so it may be used from worker threads.
// Requires a QCoreApplication instance.
class QtHttpClient : public HttpClient {
public:
    HttpResponse post(const HttpRequest& request) override;
};

// Short, key-free summary for error messages ("HTTP 429", "timeout", ...).
std::string describe_failure(const HttpResponse& r);

}
