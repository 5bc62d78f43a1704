#pragma once

#include "html/Document.hpp"
#include "net/HttpClient.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace net {

struct FetcherConfig {
    std::string listings_url = "https://www.deanza.edu/schedule/listings.html";
    int max_retries = 3;       // total attempts
    int base_delay_secs = 2;   // wait (attempt_index + 1) * base_delay_secs between attempts
    int timeout_secs = 15;     // per request
    size_t min_body_bytes = 100;
};

class FetchError : public std::runtime_error {
public:
    FetchError(const std::string& last_cause, int attempts);

    const std::string& last_cause() const { return last_cause_; }
    int attempts() const { return attempts_; }

private:
    std::string last_cause_;
    int attempts_;
};

// Retrieves listing pages with retry. Holds a reference to a caller-owned
// client and no per-request state.
class Fetcher {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    explicit Fetcher(HttpClient& client, FetcherConfig cfg = {}, Sleeper sleeper = {});

    // {listings_url}?dept={department}&t={term}
    std::string listings_url(const std::string& department, const std::string& term) const;

    // throws FetchError once every attempt failed validation
    html::Document fetch_listings(const std::string& department, const std::string& term) const;

    // one fetch + validation; on failure returns nothing and sets cause
    std::optional<html::Document> try_fetch(const std::string& url, std::string& cause) const;

    const FetcherConfig& config() const { return cfg_; }

private:
    HttpClient& client_;
    FetcherConfig cfg_;
    Sleeper sleep_;
};

}  // namespace net
