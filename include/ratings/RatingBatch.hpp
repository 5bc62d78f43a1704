#pragma once
#include <map>
#include <string>
#include <vector>

#include "listing/CourseSection.hpp"
#include "ratings/RatingResolver.hpp"

namespace ratings {

// distinct professors in first-appearance order, "TBA" excluded
std::vector<std::string> distinct_professors(const std::vector<listing::CourseSection>& sections);

// Looks every distinct professor up, one at a time, and attaches the result
// to each of their sections. Returns the ratings that were found.
std::map<std::string, Rating> attach_ratings(std::vector<listing::CourseSection>& sections,
                                             const RatingResolver& resolver);

// rated sections first, highest score first; unrated (or 0.0) last; stable
void sort_by_rating(std::vector<listing::CourseSection>& sections);

}  // namespace ratings
