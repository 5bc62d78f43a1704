#include "schedule/TimeParser.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <regex>

namespace schedule {

bool is_day_letter(char c) {
    switch (c) {
        case 'M': case 'T': case 'W': case 'R': case 'F': case 'S': case 'U':
            return true;
        default:
            return false;
    }
}

std::string day_name(char c) {
    switch (c) {
        case 'M': return "Monday";
        case 'T': return "Tuesday";
        case 'W': return "Wednesday";
        case 'R': return "Thursday";
        case 'F': return "Friday";
        case 'S': return "Saturday";
        case 'U': return "Sunday";
        default:  return "";
    }
}

std::optional<int> parse_clock_12h(const std::string& s) {
    static const std::regex re(R"(^\s*(\d{1,2}):(\d{2})\s*([AaPp])[Mm]\s*$)");

    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;

    const int hour = std::stoi(m[1].str());
    const int minute = std::stoi(m[2].str());
    if (hour < 1 || hour > 12) return std::nullopt;
    if (minute < 0 || minute > 59) return std::nullopt;

    const bool pm = (m[3].str() == "P" || m[3].str() == "p");
    int hour24 = hour % 12;  // 12 AM -> 0, 12 PM -> 12 after the PM bump
    if (pm) hour24 += 12;

    return hour24 * 60 + minute;
}

std::optional<TimeInterval> parse_time(const std::string& raw) {
    if (raw.empty() || raw == "TBA") return std::nullopt;

    // leading run of day letters and whitespace
    size_t run_end = 0;
    while (run_end < raw.size()) {
        const char c = raw[run_end];
        if (is_day_letter(c) || std::isspace(static_cast<unsigned char>(c))) {
            ++run_end;
        } else {
            break;
        }
    }

    TimeInterval ti;
    for (size_t i = 0; i < run_end; ++i) {
        if (is_day_letter(raw[i])) ti.days.push_back(raw[i]);
    }
    if (ti.days.empty()) return std::nullopt;

    static const std::regex range_re(
        R"((\d{1,2}:\d{2}\s*[AP]M)\s*-\s*(\d{1,2}:\d{2}\s*[AP]M))",
        std::regex::icase);

    std::smatch m;
    if (!std::regex_search(raw, m, range_re)) return std::nullopt;

    ti.start_text = textutil::trim(m[1].str());
    ti.end_text = textutil::trim(m[2].str());

    const auto start = parse_clock_12h(ti.start_text);
    const auto end = parse_clock_12h(ti.end_text);
    if (!start || !end) return std::nullopt;

    ti.start_minutes = *start;
    ti.end_minutes = *end;
    ti.duration_minutes = ti.end_minutes - ti.start_minutes;

    ti.day_names.reserve(ti.days.size());
    for (char d : ti.days) ti.day_names.push_back(day_name(d));

    return ti;
}

}  // namespace schedule
