#pragma once

#include "net/HttpClient.hpp"

#include <deque>
#include <map>
#include <string>
#include <vector>

namespace net {

// Scripted client for tests. Responses registered for an exact URL win;
// otherwise queued responses are handed out in order; otherwise 404.
class MockHttpClient final : public HttpClient {
    std::map<std::string, HttpResponse> by_url_;
    std::deque<HttpResponse> queue_;
    std::vector<std::string> requests_;

public:
    void respond(const std::string& url, HttpResponse resp);
    void respond(const std::string& url, int status, const std::string& body);
    void enqueue(HttpResponse resp);
    void enqueue(int status, const std::string& body);

    HttpResponse get(const std::string& url, int timeout_secs) override;

    const std::vector<std::string>& requests() const { return requests_; }
};

}  // namespace net
