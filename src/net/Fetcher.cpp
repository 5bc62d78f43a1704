#include "net/Fetcher.hpp"
#include "text/TextUtil.hpp"

#include <iostream>
#include <thread>
#include <utility>

namespace net {

FetchError::FetchError(const std::string& last_cause, int attempts)
    : std::runtime_error("Failed to fetch listings after " + std::to_string(attempts) +
                         " attempts: " + last_cause),
      last_cause_(last_cause),
      attempts_(attempts) {}

Fetcher::Fetcher(HttpClient& client, FetcherConfig cfg, Sleeper sleeper)
    : client_(client), cfg_(std::move(cfg)), sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::seconds s) { std::this_thread::sleep_for(s); };
    }
}

std::string Fetcher::listings_url(const std::string& department, const std::string& term) const {
    return cfg_.listings_url + "?dept=" + department + "&t=" + term;
}

std::optional<html::Document> Fetcher::try_fetch(const std::string& url, std::string& cause) const {
    const HttpResponse resp = client_.get(url, cfg_.timeout_secs);

    if (resp.status != 200) {
        cause = "HTTP " + std::to_string(resp.status);
        if (!resp.error.empty()) cause += ": " + resp.error;
        return std::nullopt;
    }

    if (resp.body.size() < cfg_.min_body_bytes) {
        cause = "Received empty or invalid page content";
        return std::nullopt;
    }

    const std::string page_lower = textutil::to_lower(resp.body);
    if (page_lower.find("cloudflare") != std::string::npos &&
        page_lower.find("checking your browser") != std::string::npos) {
        cause = "Stuck on bot-challenge page";
        return std::nullopt;
    }
    if (page_lower.find("error") != std::string::npos &&
        page_lower.find("403") != std::string::npos) {
        cause = "Access denied (403). The website may be blocking requests";
        return std::nullopt;
    }

    try {
        html::Document doc = html::Document::parse(resp.body);
        const std::string title = doc.title();
        if (textutil::to_lower(title).find("error") != std::string::npos) {
            cause = "Error page detected: " + title;
            return std::nullopt;
        }
        return std::optional<html::Document>(std::move(doc));
    } catch (const std::runtime_error& e) {
        cause = e.what();
        return std::nullopt;
    }
}

html::Document Fetcher::fetch_listings(const std::string& department, const std::string& term) const {
    const std::string url = listings_url(department, term);
    const int attempts = cfg_.max_retries > 0 ? cfg_.max_retries : 1;

    std::string last_cause;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        std::string cause;
        std::optional<html::Document> doc = try_fetch(url, cause);
        if (doc) {
            std::cerr << "[fetch] fetched listings (attempt " << (attempt + 1) << ")\n";
            return std::move(*doc);
        }

        last_cause = cause;
        std::cerr << "[fetch] attempt " << (attempt + 1) << " failed: " << cause << "\n";

        if (attempt + 1 < attempts) {
            const std::chrono::seconds wait((attempt + 1) * cfg_.base_delay_secs);
            std::cerr << "[fetch] waiting " << wait.count() << "s before retry\n";
            sleep_(wait);
        }
    }

    throw FetchError(last_cause, attempts);
}

}  // namespace net
