#include "listing/CourseQuery.hpp"
#include "text/TextUtil.hpp"

#include <iostream>
#include <regex>

namespace listing {

std::optional<std::pair<std::string, std::string>> parse_course_input(const std::string& input) {
    const auto parts = textutil::split_ws(textutil::to_upper(textutil::trim(input)));
    if (parts.size() < 2) return std::nullopt;

    std::vector<std::string> rest(parts.begin() + 1, parts.end());
    return std::make_pair(parts[0], textutil::join(rest, " "));
}

bool is_valid_term(const std::string& term) {
    static const std::regex re(R"(^[A-Z]+\d{4}$)");
    return std::regex_match(term, re);
}

std::vector<CourseSection> search_course(const net::Fetcher& fetcher,
                                         const std::string& department,
                                         const std::string& code,
                                         const std::string& term,
                                         const ParseOptions& opt) {
    const std::string needle = department + " " + code;
    std::cerr << "[search] " << needle << " in " << term << "\n";

    const html::Document doc = fetcher.fetch_listings(department, term);

    ListingParser parser;
    std::vector<CourseSection> sections = parser.parse(doc, needle, opt);
    for (auto& s : sections) {
        if (s.course.empty()) s.course = needle;
    }
    attach_time_data(sections);
    return sections;
}

}  // namespace listing
