#include "listing/CourseSection.hpp"

namespace listing {

const char* format_str(Format f) {
    switch (f) {
        case Format::Online: return "Online";
        case Format::Hybrid: return "Hybrid";
        case Format::InPerson: return "In-Person";
        case Format::Unknown: return "Unknown";
        default: return "Unknown";
    }
}

Format format_from_str(const std::string& s) {
    if (s == "Online") return Format::Online;
    if (s == "Hybrid") return Format::Hybrid;
    if (s == "In-Person") return Format::InPerson;
    return Format::Unknown;
}

void attach_time_data(std::vector<CourseSection>& sections) {
    for (auto& s : sections) s.time_data = schedule::parse_time(s.class_time);
}

}  // namespace listing
