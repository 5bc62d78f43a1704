#pragma once

#include "net/HttpClient.hpp"

#include <string>
#include <vector>

namespace net {

struct CurlConfig {
    std::string curl_path = "curl";
    // a desktop-browser identity; bot-challenge layers reject library agents
    std::string user_agent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/124.0.0.0 Safari/537.36";
    std::string accept = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    std::string accept_language = "en-US,en;q=0.9";
};

// Drives the curl executable once per request. Holds configuration only.
class CurlHttpClient final : public HttpClient {
    CurlConfig cfg_;

public:
    explicit CurlHttpClient(CurlConfig cfg = {});

    HttpResponse get(const std::string& url, int timeout_secs) override;

    // the argv handed to curl, exposed for tests
    std::vector<std::string> build_argv(const std::string& url, int timeout_secs) const;

    // splits "<body>\n<marker><status>" as written by build_argv's -w option
    static bool split_status(const std::string& output, std::string& body, int& status);
};

}  // namespace net
