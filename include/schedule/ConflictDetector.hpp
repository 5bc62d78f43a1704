#pragma once
#include <string>
#include <vector>

#include "listing/CourseSection.hpp"

namespace schedule {

struct SectionRef {
    std::string course;
    std::string crn;
    std::string professor;
};

struct Conflict {
    SectionRef first;
    SectionRef second;
    std::vector<char> shared_days;  // in the first section's day order
    std::string first_time;         // "08:30 AM - 10:45 AM"
    std::string second_time;
};

// Half-open overlap: [a_start, a_end) and [b_start, b_end) intersect.
// Touching endpoints do not overlap.
inline bool overlaps(int a_start, int a_end, int b_start, int b_end) {
    return a_start < b_end && a_end > b_start;
}

// Every pair i<j (i ascending, then j ascending) whose parsed intervals share
// a weekday and overlap. Sections without time_data are skipped.
std::vector<Conflict> detect_conflicts(const std::vector<listing::CourseSection>& sections);

}  // namespace schedule
