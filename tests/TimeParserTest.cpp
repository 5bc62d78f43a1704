#include <gtest/gtest.h>

#include "schedule/TimeParser.hpp"

TEST(TimeParser, ParsesDaysAndRange) {
    const auto t = schedule::parse_time("M W 08:30 AM-10:45 AM");
    ASSERT_TRUE(t.has_value());

    EXPECT_EQ(t->days, (std::vector<char>{'M', 'W'}));
    EXPECT_EQ(t->day_names, (std::vector<std::string>{"Monday", "Wednesday"}));
    EXPECT_EQ(t->start_minutes, 510);
    EXPECT_EQ(t->end_minutes, 645);
    EXPECT_EQ(t->duration_minutes, 135);
    EXPECT_EQ(t->range_text(), "08:30 AM - 10:45 AM");
}

TEST(TimeParser, TbaAndEmptyHaveNoInterval) {
    EXPECT_FALSE(schedule::parse_time("TBA").has_value());
    EXPECT_FALSE(schedule::parse_time("").has_value());
}

TEST(TimeParser, RequiresLeadingDays) {
    EXPECT_FALSE(schedule::parse_time("08:30 AM-10:45 AM").has_value());
    EXPECT_FALSE(schedule::parse_time("Online 08:30 AM-10:45 AM").has_value());
}

TEST(TimeParser, RequiresTimeRange) {
    EXPECT_FALSE(schedule::parse_time("T R").has_value());
    EXPECT_FALSE(schedule::parse_time("T R 13:30 PM-14:00 PM").has_value());
}

TEST(TimeParser, NoonAndMidnight) {
    EXPECT_EQ(schedule::parse_clock_12h("12:00 AM"), 0);
    EXPECT_EQ(schedule::parse_clock_12h("12:15 PM"), 735);
    EXPECT_EQ(schedule::parse_clock_12h("1:05 pm"), 785);
    EXPECT_EQ(schedule::parse_clock_12h("08:30AM"), 510);
    EXPECT_FALSE(schedule::parse_clock_12h("0:30 AM").has_value());
    EXPECT_FALSE(schedule::parse_clock_12h("10:60 AM").has_value());
}

TEST(TimeParser, AfternoonSpanWithoutSpaces) {
    const auto t = schedule::parse_time("TR 1:30PM - 3:20PM");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->days, (std::vector<char>{'T', 'R'}));
    EXPECT_EQ(t->start_minutes, 810);
    EXPECT_EQ(t->end_minutes, 920);
}

TEST(TimeParser, RepeatedDayLettersKeptInOrder) {
    const auto t = schedule::parse_time("M M W 08:30 AM-09:00 AM");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->days, (std::vector<char>{'M', 'M', 'W'}));
    EXPECT_EQ(t->day_names.size(), 3u);
}

TEST(TimeParser, EndBeforeStartStillParses) {
    const auto t = schedule::parse_time("M 10:00 AM-09:00 AM");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->start_minutes, 600);
    EXPECT_EQ(t->end_minutes, 540);
    EXPECT_EQ(t->duration_minutes, -60);
}
