#pragma once
#include <string>

namespace names {

// True when both names normalize to at least two tokens and their first and
// last tokens agree, either directly or crosswise ("Last, First" display
// order). Middle names/initials never take part.
bool match_names(const std::string& search_name, const std::string& candidate_name);

}  // namespace names
