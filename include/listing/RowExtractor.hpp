#pragma once
#include <optional>
#include <string>
#include <vector>

#include "html/Document.hpp"
#include "listing/CourseSection.hpp"

namespace listing {

// Pulls one section out of one listing-table row. First match wins per field.
class RowExtractor {
public:
    // nullopt when no CRN was found in any cell
    std::optional<CourseSection> extract(const html::Node& row, const std::string& course_code) const;
    std::optional<CourseSection> extract(const html::Node& row,
                                         const std::vector<html::Node>& cells,
                                         const std::string& course_code) const;

    static Format detect_format(const html::Node& row, const std::string& row_text_lower);

    // "Nguyen, Clare", "Clare Nguyen", "Clare M. Nguyen"
    static bool matches_name_shape(const std::string& text);
    // 2-4 capitalized words, no digits, no noise words
    static bool looks_like_name(const std::string& text);

private:
    static std::string days_in_cell(const html::Node& cell);
};

}  // namespace listing
