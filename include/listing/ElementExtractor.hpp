#pragma once
#include <optional>
#include <string>

#include "html/Document.hpp"
#include "listing/CourseSection.hpp"

namespace listing {

// Regex-only fallback for markup that is not a table row.
class ElementExtractor {
public:
    // nullopt unless a CRN or a professor-shaped name was found
    std::optional<CourseSection> extract(const html::Node& element, const std::string& course_code) const;

    std::optional<CourseSection> extract_text(const std::string& text, const std::string& course_code) const;
};

}  // namespace listing
