#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "listing/CourseSection.hpp"
#include "schedule/ConflictDetector.hpp"

namespace io {

nlohmann::json section_to_json(const listing::CourseSection& s);
nlohmann::json sections_to_json(const std::vector<listing::CourseSection>& sections);
nlohmann::json conflict_to_json(const schedule::Conflict& c);
nlohmann::json conflicts_to_json(const std::vector<schedule::Conflict>& conflicts);

// Accepts a top-level array of sections or {"courses": [...]}.
// time_data is re-derived from class_time. Throws std::runtime_error.
std::vector<listing::CourseSection> load_sections(const std::string& path);
std::vector<listing::CourseSection> sections_from_json(const nlohmann::json& j, const std::string& where);

// pretty-printed, parent directories created
void write_json(const std::string& path, const nlohmann::json& j);

}  // namespace io
