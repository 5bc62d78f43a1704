#include "schedule/ConflictDetector.hpp"

#include <algorithm>

namespace schedule {

static SectionRef ref_of(const listing::CourseSection& s) {
    return SectionRef{s.course, s.crn, s.professor};
}

static std::vector<char> shared_days(const std::vector<char>& a, const std::vector<char>& b) {
    std::vector<char> out;
    for (char d : a) {
        if (std::find(out.begin(), out.end(), d) != out.end()) continue;
        if (std::find(b.begin(), b.end(), d) != b.end()) out.push_back(d);
    }
    return out;
}

std::vector<Conflict> detect_conflicts(const std::vector<listing::CourseSection>& sections) {
    std::vector<Conflict> out;

    for (size_t i = 0; i < sections.size(); ++i) {
        if (!sections[i].time_data) continue;
        const TimeInterval& t1 = *sections[i].time_data;

        for (size_t j = i + 1; j < sections.size(); ++j) {
            if (!sections[j].time_data) continue;
            const TimeInterval& t2 = *sections[j].time_data;

            std::vector<char> days = shared_days(t1.days, t2.days);
            if (days.empty()) continue;
            if (!overlaps(t1.start_minutes, t1.end_minutes, t2.start_minutes, t2.end_minutes)) continue;

            Conflict c;
            c.first = ref_of(sections[i]);
            c.second = ref_of(sections[j]);
            c.shared_days = std::move(days);
            c.first_time = t1.range_text();
            c.second_time = t2.range_text();
            out.push_back(std::move(c));
        }
    }

    return out;
}

}  // namespace schedule
