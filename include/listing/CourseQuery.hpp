#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "listing/CourseSection.hpp"
#include "listing/ListingParser.hpp"
#include "net/Fetcher.hpp"

namespace listing {

// "math 1a" -> {"MATH", "1A"}; "cis 22 c" -> {"CIS", "22 C"}
std::optional<std::pair<std::string, std::string>> parse_course_input(const std::string& input);

// "W2026", "F2025": uppercase letters then exactly four digits
bool is_valid_term(const std::string& term);

// Fetches the department listing and extracts every section of
// "{department} {code}", with time_data attached. Throws net::FetchError.
std::vector<CourseSection> search_course(const net::Fetcher& fetcher,
                                         const std::string& department,
                                         const std::string& code,
                                         const std::string& term,
                                         const ParseOptions& opt = {});

}  // namespace listing
