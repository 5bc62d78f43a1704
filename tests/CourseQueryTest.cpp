#include <gtest/gtest.h>

#include "listing/CourseQuery.hpp"
#include "net/MockHttpClient.hpp"

TEST(CourseQuery, ParseCourseInput) {
    const auto c = listing::parse_course_input("  math 1a ");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->first, "MATH");
    EXPECT_EQ(c->second, "1A");

    const auto multi = listing::parse_course_input("cis   22  c");
    ASSERT_TRUE(multi.has_value());
    EXPECT_EQ(multi->second, "22 C");

    EXPECT_FALSE(listing::parse_course_input("MATH").has_value());
    EXPECT_FALSE(listing::parse_course_input("   ").has_value());
}

TEST(CourseQuery, TermShape) {
    EXPECT_TRUE(listing::is_valid_term("W2026"));
    EXPECT_TRUE(listing::is_valid_term("SU2025"));
    EXPECT_FALSE(listing::is_valid_term("w2026"));
    EXPECT_FALSE(listing::is_valid_term("W26"));
    EXPECT_FALSE(listing::is_valid_term("2026"));
    EXPECT_FALSE(listing::is_valid_term("W20261"));
}

TEST(CourseQuery, SearchFetchesParsesAndAttachesTimes) {
    net::MockHttpClient client;
    client.enqueue(200,
                   "<html><head><title>Listings</title></head><body><table>"
                   "<tr><td>MATH 1A</td><td>12345</td><td><span class=\"days\">MW</span></td>"
                   "<td>08:30 AM-10:45 AM</td><td><a href=\"/directory/user/x\">Clare Nguyen</a></td></tr>"
                   "<tr><td>MATH 1A</td><td>12346</td><td>TBA</td></tr>"
                   "</table></body></html>");

    net::Fetcher fetcher(client, net::FetcherConfig{}, [](std::chrono::seconds) {});
    const auto sections = listing::search_course(fetcher, "MATH", "1A", "W2026");

    ASSERT_EQ(client.requests().size(), 1u);
    EXPECT_EQ(client.requests()[0], "https://www.deanza.edu/schedule/listings.html?dept=MATH&t=W2026");

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].class_time, "M W 08:30 AM-10:45 AM");
    ASSERT_TRUE(sections[0].time_data.has_value());
    EXPECT_EQ(sections[0].time_data->start_minutes, 510);
    EXPECT_EQ(sections[1].class_time, "TBA");
    EXPECT_FALSE(sections[1].time_data.has_value());
}

TEST(CourseQuery, SearchPropagatesFetchError) {
    net::MockHttpClient client;
    net::FetcherConfig cfg;
    cfg.max_retries = 2;
    net::Fetcher fetcher(client, cfg, [](std::chrono::seconds) {});

    EXPECT_THROW(listing::search_course(fetcher, "MATH", "1A", "W2026"), net::FetchError);
    EXPECT_EQ(client.requests().size(), 2u);
}
