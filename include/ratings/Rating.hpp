#pragma once
#include <optional>
#include <string>

namespace ratings {

// Any subset may be present. Never mutated once attached to a section.
struct Rating {
    std::optional<double> score;       // 0..5, one decimal
    std::optional<int> num_ratings;
    std::optional<double> difficulty;  // 0..5
    std::optional<std::string> url;    // canonical profile URL

    bool empty() const { return !score && !num_ratings && !difficulty; }
};

}  // namespace ratings
