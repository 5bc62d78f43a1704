#include <gtest/gtest.h>

#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

static fs::path write_temp(const std::string& name, const std::string& content) {
    const fs::path p = fs::temp_directory_path() / name;
    std::ofstream out(p, std::ios::out | std::ios::trunc);
    out << content;
    return p;
}

static listing::CourseSection sample_section() {
    listing::CourseSection s;
    s.course = "MATH 1A";
    s.crn = "12345";
    s.professor = "Clare Nguyen";
    s.class_time = "M W 08:30 AM-10:45 AM";
    s.format = listing::Format::InPerson;
    s.time_data = schedule::parse_time(s.class_time);
    return s;
}

TEST(JsonIO, SectionJsonCarriesTimeDataAndNullRatings) {
    const json j = io::section_to_json(sample_section());

    EXPECT_EQ(j.at("crn"), "12345");
    EXPECT_EQ(j.at("format"), "In-Person");
    EXPECT_TRUE(j.at("ratings").is_null());

    const json& t = j.at("time_data");
    EXPECT_EQ(t.at("days"), json::array({"M", "W"}));
    EXPECT_EQ(t.at("day_names"), json::array({"Monday", "Wednesday"}));
    EXPECT_EQ(t.at("start_time"), "08:30 AM");
    EXPECT_EQ(t.at("end_minutes"), 645);
    EXPECT_EQ(t.at("duration_minutes"), 135);
}

TEST(JsonIO, PartialRatingWritesNulls) {
    listing::CourseSection s = sample_section();
    ratings::Rating r;
    r.score = 4.5;
    s.ratings = r;

    const json j = io::section_to_json(s);
    EXPECT_DOUBLE_EQ(j.at("ratings").at("rating").get<double>(), 4.5);
    EXPECT_TRUE(j.at("ratings").at("num_ratings").is_null());
    EXPECT_TRUE(j.at("ratings").at("url").is_null());
}

TEST(JsonIO, ConflictJsonShape) {
    schedule::Conflict c;
    c.first = {"MATH 1A", "11111", "Clare Nguyen"};
    c.second = {"CIS 22A", "22222", "TBA"};
    c.shared_days = {'M', 'W'};
    c.first_time = "08:30 AM - 10:45 AM";
    c.second_time = "09:00 AM - 10:00 AM";

    const json j = io::conflict_to_json(c);
    EXPECT_EQ(j.at("course1").at("crn"), "11111");
    EXPECT_EQ(j.at("course2").at("course"), "CIS 22A");
    EXPECT_EQ(j.at("conflicting_days"), json::array({"M", "W"}));
    EXPECT_EQ(j.at("time2"), "09:00 AM - 10:00 AM");
}

TEST(JsonIO, LoadsArrayAndRederivesTimes) {
    const fs::path p = write_temp("sectionscout_sections_array.json",
        R"([{"course":"MATH 1A","crn":"12345","professor":"Clare Nguyen","class_time":"M W 08:30 AM-10:45 AM","format":"Online"},
            {"course":"CIS 22A","class_time":"TBA"}])");

    const auto sections = io::load_sections(p.string());
    ASSERT_EQ(sections.size(), 2u);

    EXPECT_EQ(sections[0].format, listing::Format::Online);
    ASSERT_TRUE(sections[0].time_data.has_value());
    EXPECT_EQ(sections[0].time_data->start_minutes, 510);

    EXPECT_EQ(sections[1].crn, "N/A");
    EXPECT_EQ(sections[1].professor, "TBA");
    EXPECT_FALSE(sections[1].time_data.has_value());

    fs::remove(p);
}

TEST(JsonIO, LoadsCoursesObject) {
    const fs::path p = write_temp("sectionscout_sections_object.json",
        R"({"courses":[{"course":"MATH 1A","crn":"12345","class_time":"T R 01:30 PM-03:20 PM",
                        "ratings":{"rating":4.1,"num_ratings":12,"difficulty":null,"url":null}}]})");

    const auto sections = io::load_sections(p.string());
    ASSERT_EQ(sections.size(), 1u);
    ASSERT_TRUE(sections[0].ratings.has_value());
    EXPECT_DOUBLE_EQ(sections[0].ratings->score.value(), 4.1);
    EXPECT_EQ(sections[0].ratings->num_ratings.value(), 12);
    EXPECT_FALSE(sections[0].ratings->difficulty.has_value());

    fs::remove(p);
}

TEST(JsonIO, EmptyStringsFallBackToSentinels) {
    const fs::path p = write_temp("sectionscout_sections_empty.json",
        R"([{"course":"MATH 1A","crn":"12345","professor":"","class_time":""}])");

    const auto sections = io::load_sections(p.string());
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].professor, "TBA");
    EXPECT_EQ(sections[0].class_time, "TBA");
    EXPECT_FALSE(sections[0].time_data.has_value());

    fs::remove(p);
}

TEST(JsonIO, RoundTripsWrittenSections) {
    const fs::path p = fs::temp_directory_path() / "sectionscout_out" / "sections.json";
    io::write_json(p.string(), io::sections_to_json({sample_section()}));

    const auto back = io::load_sections(p.string());
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0].crn, "12345");
    EXPECT_EQ(back[0].format, listing::Format::InPerson);

    fs::remove_all(p.parent_path());
}

TEST(JsonIO, MalformedFilesNameThePath) {
    const fs::path bad = write_temp("sectionscout_bad.json", "{not json");
    try {
        io::load_sections(bad.string());
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(bad.string()), std::string::npos);
    }
    fs::remove(bad);

    const fs::path wrong = write_temp("sectionscout_wrong.json", R"({"sections":[]})");
    EXPECT_THROW(io::load_sections(wrong.string()), std::runtime_error);
    fs::remove(wrong);

    const fs::path typed = write_temp("sectionscout_typed.json", R"([{"crn":12345}])");
    EXPECT_THROW(io::load_sections(typed.string()), std::runtime_error);
    fs::remove(typed);

    EXPECT_THROW(io::load_sections("/nonexistent/sectionscout.json"), std::runtime_error);
}
