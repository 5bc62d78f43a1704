#include "listing/ElementExtractor.hpp"

#include <regex>

namespace listing {

std::optional<CourseSection> ElementExtractor::extract(const html::Node& element, const std::string& course_code) const {
    return extract_text(element.text(" "), course_code);
}

std::optional<CourseSection> ElementExtractor::extract_text(const std::string& text, const std::string& course_code) const {
    static const std::regex crn_re(R"(\b\d{5}\b)");
    static const std::regex prof_re(R"(([A-Z][a-z]+,?\s+[A-Z][a-z]+))");
    static const std::regex time_re(R"(([MTWRF]+.*?\d{1,2}:\d{2}[AP]?M?.*?\d{1,2}:\d{2}[AP]?M?))");
    static const std::regex hybrid_re(R"(\bhybrid\b)", std::regex::icase);
    static const std::regex online_re(R"(\bonline\b)", std::regex::icase);
    static const std::regex in_person_re(R"(\bin-person\b|\bon-campus\b)", std::regex::icase);

    std::smatch m;
    std::string crn;
    std::string professor;
    std::string class_time;

    if (std::regex_search(text, m, crn_re)) crn = m.str(0);
    if (std::regex_search(text, m, prof_re)) professor = m[1].str();
    if (std::regex_search(text, m, time_re)) class_time = m[1].str();

    if (crn.empty() && professor.empty()) return std::nullopt;

    CourseSection s;
    s.course = course_code;
    s.crn = crn.empty() ? kNoCrn : crn;
    if (!professor.empty()) s.professor = professor;
    if (!class_time.empty()) s.class_time = class_time;

    if (std::regex_search(text, online_re)) s.format = Format::Online;
    else if (std::regex_search(text, hybrid_re)) s.format = Format::Hybrid;
    else if (std::regex_search(text, in_person_re)) s.format = Format::InPerson;

    return s;
}

}  // namespace listing
