#pragma once
#include <string>
#include <vector>

namespace textutil {

// strip ASCII whitespace (and U+00A0 no-break space) from both ends
std::string trim(const std::string& s);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// split on runs of whitespace, no empty pieces
std::vector<std::string> split_ws(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// case-insensitive (ASCII) substring test
bool contains_ci(const std::string& haystack, const std::string& needle);

bool has_digit(const std::string& s);

// replaces every U+00A0 with a plain space
std::string fold_nbsp(const std::string& s);

// percent-encode everything outside A-Z a-z 0-9 - _ . ~ /
std::string url_encode(const std::string& s);

}  // namespace textutil
