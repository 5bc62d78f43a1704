#pragma once
#include <optional>
#include <string>
#include <vector>

#include "ratings/Rating.hpp"
#include "schedule/TimeParser.hpp"

namespace listing {

inline constexpr const char* kTba = "TBA";
inline constexpr const char* kNoCrn = "N/A";

enum class Format {
    Online,
    Hybrid,
    InPerson,
    Unknown
};

const char* format_str(Format f);
// inverse of format_str; anything unrecognized is Unknown
Format format_from_str(const std::string& s);

struct CourseSection {
    std::string course;                 // "MATH 1A"
    std::string crn = kNoCrn;           // 5 digits or "N/A"
    std::string professor = kTba;
    std::string class_time = kTba;      // raw "M W 08:30 AM-10:45 AM"
    Format format = Format::Unknown;

    std::optional<schedule::TimeInterval> time_data;
    std::optional<ratings::Rating> ratings;
};

// fills time_data from class_time; unparseable times leave it empty
void attach_time_data(std::vector<CourseSection>& sections);

}  // namespace listing
