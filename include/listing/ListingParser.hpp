#pragma once
#include <memory>
#include <string>
#include <vector>

#include "html/Document.hpp"
#include "listing/CourseSection.hpp"
#include "listing/ElementExtractor.hpp"
#include "listing/RowExtractor.hpp"

namespace listing {

// One way of locating sections in a listings document. The parser tries a
// chain of these in priority order and keeps the first non-empty result.
class ExtractionStrategy {
public:
    virtual ~ExtractionStrategy() = default;
    virtual const char* name() const = 0;
    virtual std::vector<CourseSection> extract(const html::Document& doc, const std::string& course_code) const = 0;
};

// every <tr> of every <table> whose cell text contains the course code
class TableRowStrategy final : public ExtractionStrategy {
public:
    const char* name() const override { return "table-rows"; }
    std::vector<CourseSection> extract(const html::Document& doc, const std::string& course_code) const override;

private:
    RowExtractor rows_;
};

// <div>/<tr> with a course/section/listing class, else any <tr>; the innermost
// candidate carrying the course code wins
class ClassMatchStrategy final : public ExtractionStrategy {
public:
    const char* name() const override { return "class-matched"; }
    std::vector<CourseSection> extract(const html::Document& doc, const std::string& course_code) const override;

private:
    RowExtractor rows_;
    ElementExtractor elements_;
};

// text nodes mentioning the course code, extracted from their nearest
// <tr>/<div>/<li> ancestor
class TextSearchStrategy final : public ExtractionStrategy {
public:
    const char* name() const override { return "text-search"; }
    std::vector<CourseSection> extract(const html::Document& doc, const std::string& course_code) const override;

private:
    ElementExtractor elements_;
};

struct ParseOptions {
    std::string save_html_path;  // always dump the page here when set
    std::string debug_dir;       // dump the page here when the course code is absent
};

// keeps the first record per CRN; "N/A" records are never collapsed
std::vector<CourseSection> dedupe_by_crn(const std::vector<CourseSection>& sections);

class ListingParser {
public:
    ListingParser();  // table rows -> class-matched -> text search
    explicit ListingParser(std::vector<std::unique_ptr<ExtractionStrategy>> chain);

    // course_code is the full needle, e.g. "MATH 1A"
    std::vector<CourseSection> parse(const html::Document& doc,
                                     const std::string& course_code,
                                     const ParseOptions& opt = {}) const;

private:
    std::vector<std::unique_ptr<ExtractionStrategy>> chain_;
};

}  // namespace listing
