#include "net/MockHttpClient.hpp"

#include <utility>

namespace net {

static HttpResponse make_response(int status, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.body = body;
    return r;
}

void MockHttpClient::respond(const std::string& url, HttpResponse resp) {
    by_url_[url] = std::move(resp);
}

void MockHttpClient::respond(const std::string& url, int status, const std::string& body) {
    respond(url, make_response(status, body));
}

void MockHttpClient::enqueue(HttpResponse resp) {
    queue_.push_back(std::move(resp));
}

void MockHttpClient::enqueue(int status, const std::string& body) {
    enqueue(make_response(status, body));
}

HttpResponse MockHttpClient::get(const std::string& url, int) {
    requests_.push_back(url);

    auto it = by_url_.find(url);
    if (it != by_url_.end()) return it->second;

    if (!queue_.empty()) {
        HttpResponse r = std::move(queue_.front());
        queue_.pop_front();
        return r;
    }

    return make_response(404, "");
}

}  // namespace net
