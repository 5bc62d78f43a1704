#include "listing/ListingParser.hpp"
#include "text/TextUtil.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <unordered_set>

namespace fs = std::filesystem;

namespace listing {

static std::string escape_regex(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

static void dump_html(const fs::path& path, const std::string& html) {
    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[parse] cannot create " << path.parent_path().string() << ": " << e.what() << "\n";
        return;
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        std::cerr << "[parse] cannot write " << path.string() << "\n";
        return;
    }
    out << html;
    std::cerr << "[parse] saved page HTML to " << path.string() << "\n";
}

std::vector<CourseSection> TableRowStrategy::extract(const html::Document& doc, const std::string& course_code) const {
    std::vector<CourseSection> out;
    const std::string code_upper = textutil::to_upper(course_code);

    const auto tables = doc.find_all({"table"});
    std::cerr << "[parse] found " << tables.size() << " table(s)\n";

    for (const auto& table : tables) {
        const auto rows = table.find_all({"tr"});
        for (const auto& row : rows) {
            const auto cells = row.find_all({"td", "th"});
            if (cells.empty()) continue;

            std::vector<std::string> texts;
            texts.reserve(cells.size());
            for (const auto& c : cells) texts.push_back(c.text());
            if (textutil::to_upper(textutil::join(texts, " ")).find(code_upper) == std::string::npos) continue;

            if (auto s = rows_.extract(row, cells, course_code)) {
                std::cerr << "[parse] found section: " << s->crn << " - " << s->professor << "\n";
                out.push_back(std::move(*s));
            }
        }
    }
    return out;
}

std::vector<CourseSection> ClassMatchStrategy::extract(const html::Document& doc, const std::string& course_code) const {
    static const std::regex keyword_re("course|section|listing", std::regex::icase);

    std::vector<html::Node> candidates = doc.find_all([](const html::Node& n) {
        return (n.is_tag("div") || n.is_tag("tr")) && n.class_matches(keyword_re);
    });
    if (candidates.empty()) candidates = doc.find_all({"tr"});
    std::cerr << "[parse] " << candidates.size() << " candidate element(s)\n";

    std::vector<html::Node> bearing;
    for (const auto& c : candidates) {
        if (textutil::contains_ci(c.text(" "), course_code)) bearing.push_back(c);
    }

    std::vector<CourseSection> out;
    for (size_t i = 0; i < bearing.size(); ++i) {
        bool has_inner = false;
        for (size_t j = 0; j < bearing.size() && !has_inner; ++j) {
            if (j != i && bearing[j].is_descendant_of(bearing[i])) has_inner = true;
        }
        if (has_inner) continue;

        std::optional<CourseSection> s;
        const html::Node& el = bearing[i];
        if (el.is_tag("tr")) {
            const auto cells = el.find_all({"td", "th"});
            if (!cells.empty()) s = rows_.extract(el, cells, course_code);
        }
        if (!s) s = elements_.extract(el, course_code);
        if (s) out.push_back(std::move(*s));
    }
    return out;
}

std::vector<CourseSection> TextSearchStrategy::extract(const html::Document& doc, const std::string& course_code) const {
    const std::regex needle_re(escape_regex(course_code), std::regex::icase);
    const auto hits = doc.text_nodes_matching(needle_re);
    std::cerr << "[parse] " << hits.size() << " text node(s) mention " << course_code << "\n";

    std::vector<CourseSection> out;
    std::vector<html::Node> seen;
    for (const auto& hit : hits) {
        html::Node container = hit.closest({"tr", "div", "li"});
        if (!container) continue;

        bool dup = false;
        for (const auto& s : seen) {
            if (s == container) {
                dup = true;
                break;
            }
        }
        if (dup) continue;
        seen.push_back(container);

        if (auto s = elements_.extract(container, course_code)) out.push_back(std::move(*s));
    }
    return out;
}

std::vector<CourseSection> dedupe_by_crn(const std::vector<CourseSection>& sections) {
    std::vector<CourseSection> out;
    std::unordered_set<std::string> seen;

    for (const auto& s : sections) {
        if (s.crn == kNoCrn || seen.insert(s.crn).second) out.push_back(s);
    }
    return out;
}

ListingParser::ListingParser() {
    chain_.push_back(std::make_unique<TableRowStrategy>());
    chain_.push_back(std::make_unique<ClassMatchStrategy>());
    chain_.push_back(std::make_unique<TextSearchStrategy>());
}

ListingParser::ListingParser(std::vector<std::unique_ptr<ExtractionStrategy>> chain)
    : chain_(std::move(chain)) {}

std::vector<CourseSection> ListingParser::parse(const html::Document& doc,
                                                const std::string& course_code,
                                                const ParseOptions& opt) const {
    if (!opt.save_html_path.empty()) dump_html(opt.save_html_path, doc.source());

    const std::string page_text = doc.text();
    if (textutil::trim(page_text).size() < 100) {
        std::cerr << "[parse] warning: page seems empty or invalid (length: " << page_text.size() << ")\n";
    }
    if (!textutil::contains_ci(page_text, course_code)) {
        std::cerr << "[parse] warning: course code '" << course_code << "' not found in page text\n";
        if (!opt.debug_dir.empty()) {
            std::string stem = course_code;
            for (char& c : stem) {
                if (c == ' ') c = '_';
            }
            dump_html(fs::path(opt.debug_dir) / ("debug_no_course_" + stem + ".html"), doc.source());
        }
    }

    for (const auto& strategy : chain_) {
        std::vector<CourseSection> found = strategy->extract(doc, course_code);
        if (found.empty()) continue;

        auto unique = dedupe_by_crn(found);
        std::cerr << "[parse] " << strategy->name() << ": returning " << unique.size() << " unique section(s)\n";
        return unique;
    }

    std::cerr << "[parse] no sections found for " << course_code << "\n";
    return {};
}

}  // namespace listing
