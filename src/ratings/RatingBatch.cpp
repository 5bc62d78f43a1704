#include "ratings/RatingBatch.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace ratings {

static double sort_score(const listing::CourseSection& s) {
    if (!s.ratings || !s.ratings->score) return 0.0;
    return *s.ratings->score;
}

std::vector<std::string> distinct_professors(const std::vector<listing::CourseSection>& sections) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& s : sections) {
        if (s.professor == listing::kTba) continue;
        if (seen.insert(s.professor).second) out.push_back(s.professor);
    }
    return out;
}

std::map<std::string, Rating> attach_ratings(std::vector<listing::CourseSection>& sections,
                                             const RatingResolver& resolver) {
    const auto professors = distinct_professors(sections);
    std::cerr << "[ratings] fetching ratings for " << professors.size() << " professor(s)\n";

    std::map<std::string, Rating> found;
    for (size_t i = 0; i < professors.size(); ++i) {
        const std::string& name = professors[i];
        std::cerr << "[ratings] [" << (i + 1) << "/" << professors.size() << "] " << name << "\n";

        if (auto r = resolver.lookup(name)) found.emplace(name, *r);
    }
    std::cerr << "[ratings] fetched ratings for " << found.size() << "/" << professors.size() << " professor(s)\n";

    for (auto& s : sections) {
        auto it = found.find(s.professor);
        if (it != found.end()) s.ratings = it->second;
    }
    return found;
}

void sort_by_rating(std::vector<listing::CourseSection>& sections) {
    std::stable_sort(sections.begin(), sections.end(),
                     [](const listing::CourseSection& a, const listing::CourseSection& b) {
                         const double sa = sort_score(a);
                         const double sb = sort_score(b);
                         const bool a_unrated = sa == 0.0;
                         const bool b_unrated = sb == 0.0;
                         if (a_unrated != b_unrated) return !a_unrated;
                         return sa > sb;
                     });
}

}  // namespace ratings
