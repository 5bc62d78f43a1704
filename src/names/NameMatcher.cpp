#include "names/NameMatcher.hpp"
#include "names/NameNormalizer.hpp"

namespace names {

bool match_names(const std::string& search_name, const std::string& candidate_name) {
    const auto search = normalize_name(search_name);
    const auto cand = normalize_name(candidate_name);

    if (search.size() < 2 || cand.size() < 2) return false;

    const std::string& s_first = search.front();
    const std::string& s_last = search.back();
    const std::string& c_first = cand.front();
    const std::string& c_last = cand.back();

    if (s_first == c_first && s_last == c_last) return true;
    return s_first == c_last && s_last == c_first;
}

}  // namespace names
