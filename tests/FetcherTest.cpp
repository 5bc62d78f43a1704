#include <gtest/gtest.h>

#include "net/Fetcher.hpp"
#include "net/MockHttpClient.hpp"

#include <chrono>
#include <string>
#include <vector>

static std::string listing_page(const std::string& title = "Schedule Listings") {
    return "<html><head><title>" + title + "</title></head><body><table>"
           "<tr><td>MATH 1A</td><td>12345</td><td>M W 08:30 AM-10:45 AM</td></tr>"
           "<tr><td>MATH 1A</td><td>12346</td><td>T R 10:30 AM-12:45 PM</td></tr>"
           "</table></body></html>";
}

class FetcherTest : public ::testing::Test {
protected:
    net::MockHttpClient client;
    std::vector<long long> waits;

    net::Fetcher make_fetcher(int max_retries = 3) {
        net::FetcherConfig cfg;
        cfg.max_retries = max_retries;
        return net::Fetcher(client, cfg, [this](std::chrono::seconds s) { waits.push_back(s.count()); });
    }
};

TEST_F(FetcherTest, ListingsUrlFormat) {
    const auto fetcher = make_fetcher();
    EXPECT_EQ(fetcher.listings_url("MATH", "W2026"),
              "https://www.deanza.edu/schedule/listings.html?dept=MATH&t=W2026");
}

TEST_F(FetcherTest, ThreeFailuresThrowWithLastCause) {
    client.enqueue(500, "");
    client.enqueue(502, "");
    client.enqueue(503, "");
    const auto fetcher = make_fetcher(3);

    try {
        fetcher.fetch_listings("MATH", "W2026");
        FAIL() << "expected FetchError";
    } catch (const net::FetchError& e) {
        EXPECT_EQ(e.last_cause(), "HTTP 503");
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_NE(std::string(e.what()).find("after 3 attempts"), std::string::npos);
    }

    EXPECT_EQ(client.requests().size(), 3u);
    EXPECT_EQ(waits, (std::vector<long long>{2, 4}));
}

TEST_F(FetcherTest, SuccessOnSecondAttemptStopsRetrying) {
    client.enqueue(500, "");
    client.enqueue(200, listing_page());
    client.enqueue(200, listing_page());
    const auto fetcher = make_fetcher(3);

    const html::Document doc = fetcher.fetch_listings("MATH", "W2026");
    EXPECT_EQ(doc.title(), "Schedule Listings");
    EXPECT_EQ(client.requests().size(), 2u);
    EXPECT_EQ(waits, (std::vector<long long>{2}));
}

TEST_F(FetcherTest, SingleAttemptNeverSleeps) {
    client.enqueue(404, "");
    const auto fetcher = make_fetcher(1);

    EXPECT_THROW(fetcher.fetch_listings("MATH", "W2026"), net::FetchError);
    EXPECT_TRUE(waits.empty());
}

TEST_F(FetcherTest, ShortBodyRejected) {
    client.enqueue(200, "<html></html>");
    std::string cause;
    EXPECT_FALSE(make_fetcher().try_fetch("u", cause).has_value());
    EXPECT_EQ(cause, "Received empty or invalid page content");
}

TEST_F(FetcherTest, BotChallengeRejected) {
    client.enqueue(200, "<html><head><title>Just a moment</title></head><body>"
                        "Checking your browser before accessing the site. "
                        "This process is automatic. DDoS protection by Cloudflare.</body></html>");
    std::string cause;
    EXPECT_FALSE(make_fetcher().try_fetch("u", cause).has_value());
    EXPECT_EQ(cause, "Stuck on bot-challenge page");
}

TEST_F(FetcherTest, AccessDeniedRejected) {
    client.enqueue(200, "<html><head><title>Forbidden</title></head><body>"
                        "Error 403: you do not have permission to access this resource on this server.</body></html>");
    std::string cause;
    EXPECT_FALSE(make_fetcher().try_fetch("u", cause).has_value());
    EXPECT_EQ(cause.rfind("Access denied (403)", 0), 0u);
}

TEST_F(FetcherTest, ErrorTitleRejected) {
    client.enqueue(200, listing_page("Application Error"));
    std::string cause;
    EXPECT_FALSE(make_fetcher().try_fetch("u", cause).has_value());
    EXPECT_EQ(cause, "Error page detected: Application Error");
}

TEST_F(FetcherTest, TransportErrorIsPartOfCause) {
    net::HttpResponse r;
    r.error = "curl exited with code 28";
    client.enqueue(r);
    std::string cause;
    EXPECT_FALSE(make_fetcher().try_fetch("u", cause).has_value());
    EXPECT_EQ(cause, "HTTP 0: curl exited with code 28");
}
