#pragma once
#include <string>

namespace net {

struct HttpResponse {
    int status = 0;       // 0 when the request never completed
    std::string body;
    std::string error;    // transport problem, "" otherwise

    bool ok() const { return status == 200; }
};

// Blocking GET. Implementations hold configuration only, so one instance can
// be shared by concurrent callers. Transport failures are reported through
// HttpResponse::error rather than thrown.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, int timeout_secs) = 0;
};

class NullHttpClient final : public HttpClient {
public:
    HttpResponse get(const std::string&, int) override {
        HttpResponse r;
        r.error = "no HTTP client configured";
        return r;
    }
};

}  // namespace net
