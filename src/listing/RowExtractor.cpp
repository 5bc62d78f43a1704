#include "listing/RowExtractor.hpp"
#include "schedule/TimeParser.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <regex>
#include <unordered_set>

namespace listing {

static const std::regex& crn_re() {
    static const std::regex re(R"(\b(\d{5})\b)");
    return re;
}

static const std::regex& time_range_re() {
    static const std::regex re(R"((\d{1,2}:\d{2}\s*[AP]M)\s*-\s*(\d{1,2}:\d{2}\s*[AP]M))", std::regex::icase);
    return re;
}

static std::string strip_word_punct(const std::string& w) {
    size_t a = 0;
    size_t b = w.size();
    while (a < b && std::ispunct(static_cast<unsigned char>(w[a]))) ++a;
    while (b > a && std::ispunct(static_cast<unsigned char>(w[b - 1]))) --b;
    return w.substr(a, b - a);
}

static bool is_noise_word(const std::string& word_lower) {
    static const std::unordered_set<std::string> noise = {
        "view", "footnote", "math", "calculus", "class", "meets",
        "campus", "on-campus", "online", "hybrid", "tba", "tbd",
        "am", "pm", "open", "wl", "waitlist",
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
    };
    return noise.count(word_lower) > 0;
}

bool RowExtractor::matches_name_shape(const std::string& text) {
    static const std::regex last_first(R"(^([A-Z][a-z]+(?:-[A-Z][a-z]+)?),\s+([A-Z][a-z]+(?:\s+[A-Z][a-z]+)?)$)");
    static const std::regex first_last(R"(^[A-Z][a-z]+\s+[A-Z][a-z]+$)");
    static const std::regex first_m_last(R"(^[A-Z][a-z]+\s+[A-Z]\.\s+[A-Z][a-z]+$)");

    return std::regex_match(text, last_first) ||
           std::regex_match(text, first_last) ||
           std::regex_match(text, first_m_last);
}

bool RowExtractor::looks_like_name(const std::string& text) {
    const auto words = textutil::split_ws(text);
    if (words.size() < 2 || words.size() > 4) return false;
    if (textutil::has_digit(text)) return false;

    for (const auto& w : words) {
        if (!std::isupper(static_cast<unsigned char>(w[0]))) return false;
        if (is_noise_word(textutil::to_lower(strip_word_punct(w)))) return false;
    }
    return true;
}

std::string RowExtractor::days_in_cell(const html::Node& cell) {
    html::Node span = cell.find_first([](const html::Node& n) {
        return n.is_tag("span") && n.has_class("days");
    });
    if (!span) return "";

    std::vector<std::string> letters;
    for (char c : span.text()) {
        // the "·" separator is multi-byte and never a day letter
        if (schedule::is_day_letter(c)) letters.emplace_back(1, c);
    }
    return textutil::join(letters, " ");
}

Format RowExtractor::detect_format(const html::Node& row, const std::string& row_text_lower) {
    static const std::regex skittle_hybrid("skittle.*hybrid", std::regex::icase);

    html::Node hybrid_span = row.find_first([](const html::Node& n) {
        return n.is_tag("span") && n.class_matches(skittle_hybrid);
    });

    auto has = [&](const char* s) { return row_text_lower.find(s) != std::string::npos; };

    if (hybrid_span || has("hybrid")) return Format::Hybrid;
    if (has("fully online") || has("online class")) return Format::Online;
    if (has("fully on-campus") || has("on-campus")) return Format::InPerson;
    if (has("online")) return Format::Online;
    return Format::Unknown;
}

std::optional<CourseSection> RowExtractor::extract(const html::Node& row, const std::string& course_code) const {
    return extract(row, row.find_all({"td", "th"}), course_code);
}

std::optional<CourseSection> RowExtractor::extract(const html::Node& row,
                                                   const std::vector<html::Node>& cells,
                                                   const std::string& course_code) const {
    std::vector<std::string> cell_texts;
    cell_texts.reserve(cells.size());
    for (const auto& c : cells) cell_texts.push_back(c.text());

    const std::string row_text_lower = textutil::to_lower(textutil::join(cell_texts, " "));
    const std::string code_upper = textutil::to_upper(course_code);

    std::string crn;
    std::string days;
    std::string time_str;
    std::string professor;

    for (size_t i = 0; i < cells.size(); ++i) {
        const html::Node& cell = cells[i];
        const std::string& text = cell_texts[i];
        const std::string text_upper = textutil::to_upper(text);

        if (crn.empty()) {
            std::smatch m;
            if (std::regex_search(text, m, crn_re())) crn = m[1].str();
        }

        if (days.empty()) days = days_in_cell(cell);

        if (time_str.empty()) {
            if (std::regex_search(text, time_range_re())) {
                time_str = textutil::trim(text);
            } else if (text_upper.find("TBA") != std::string::npos) {
                time_str = kTba;
            }
        }

        if (professor.empty()) {
            html::Node link = cell.find_first([](const html::Node& n) {
                return n.is_tag("a") && n.attr("href").find("/directory/user") != std::string::npos;
            });
            if (link) {
                professor = link.text();
            } else if (!text.empty() && !crn.empty() &&
                       text.find(crn) == std::string::npos &&
                       text_upper.find(code_upper) == std::string::npos) {
                if (matches_name_shape(text) || looks_like_name(text)) professor = text;
            }
        }
    }

    if (crn.empty()) return std::nullopt;

    CourseSection s;
    s.course = course_code;
    s.crn = crn;
    if (!professor.empty()) s.professor = professor;

    if (!time_str.empty()) {
        s.class_time = days.empty() ? time_str : days + " " + time_str;
    }
    s.format = detect_format(row, row_text_lower);
    return s;
}

}  // namespace listing
