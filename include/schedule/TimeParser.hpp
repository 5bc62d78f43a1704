#pragma once
#include <optional>
#include <string>
#include <vector>

namespace schedule {

struct TimeInterval {
    std::vector<char> days;              // weekday letters in source order, e.g. {'M','W'}
    std::vector<std::string> day_names;  // "Monday", "Wednesday"
    std::string start_text;              // "08:30 AM" as matched
    std::string end_text;
    int start_minutes = 0;               // minutes since midnight
    int end_minutes = 0;
    int duration_minutes = 0;            // end - start, not validated

    std::string range_text() const { return start_text + " - " + end_text; }
};

bool is_day_letter(char c);

// 'M' -> "Monday" ... 'U' -> "Sunday"; "" for anything else
std::string day_name(char c);

// "08:30 AM" -> 510. std::nullopt if hour is not 1-12 or minute not 0-59.
std::optional<int> parse_clock_12h(const std::string& s);

// "M W 08:30 AM-10:45 AM" -> days {M,W}, 510..645
// std::nullopt for "", "TBA", no leading day letters, or no valid time range.
std::optional<TimeInterval> parse_time(const std::string& raw);

}  // namespace schedule
