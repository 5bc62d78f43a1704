#include "names/NameNormalizer.hpp"
#include "text/TextUtil.hpp"

#include <cctype>

namespace names {

static bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
static bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }

static bool is_name_prefix(const std::string& s) {
    static const char* const prefixes[] = {
        "Mc", "Mac", "O'", "De", "Van", "Von", "La", "Le", "St", "Saint"
    };
    for (const char* p : prefixes) {
        if (s == p) return true;
    }
    return false;
}

std::string strip_parentheticals(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '(') {
            size_t close = s.find(')', i + 1);
            if (close != std::string::npos) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

std::string commas_to_spaces(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c == ',') c = ' ';
    }
    return out;
}

std::string split_glued_initials(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 4);
    for (size_t i = 0; i < s.size(); ++i) {
        out.push_back(s[i]);
        if (s[i] == '.' && i + 1 < s.size() && is_upper(s[i + 1])) out.push_back(' ');
    }
    return out;
}

std::vector<std::string> split_capitalized(const std::string& word) {
    std::vector<std::string> parts;
    for (char c : word) {
        if (is_upper(c)) {
            parts.emplace_back(1, c);
        } else if (!parts.empty()) {
            parts.back().push_back(c);
        }
    }
    return parts;
}

std::vector<std::string> merge_name_prefixes(const std::vector<std::string>& parts) {
    std::vector<std::string> merged;
    merged.reserve(parts.size());

    size_t i = 0;
    while (i < parts.size()) {
        if (is_name_prefix(parts[i]) && i + 1 < parts.size()) {
            merged.push_back(parts[i] + parts[i + 1]);
            i += 2;
        } else {
            merged.push_back(parts[i]);
            ++i;
        }
    }
    return merged;
}

std::vector<std::string> split_glued_name(const std::string& token) {
    std::vector<std::string> parts{token};

    const auto caps = split_capitalized(token);
    if (caps.size() >= 2) parts = merge_name_prefixes(caps);
    if (parts.size() != 1) return parts;

    // "rodericTaylor": leading lowercase run, then a capitalized remainder
    size_t k = 0;
    while (k < token.size() && is_lower(token[k])) ++k;
    if (k == 0 || k >= token.size() || !is_upper(token[k])) return parts;

    const std::string first = token.substr(0, k);
    const std::string rest = token.substr(k);

    const auto rest_caps = split_capitalized(rest);
    std::vector<std::string> out{first};
    if (rest_caps.size() >= 2) {
        for (auto& p : merge_name_prefixes(rest_caps)) out.push_back(std::move(p));
    } else {
        out.push_back(rest);
    }
    return out;
}

std::vector<std::string> normalize_name(const std::string& raw) {
    std::string s = strip_parentheticals(raw);
    s = commas_to_spaces(s);
    s = split_glued_initials(s);

    std::vector<std::string> parts = textutil::split_ws(s);
    if (parts.size() == 1) parts = split_glued_name(parts[0]);

    std::vector<std::string> cleaned;
    cleaned.reserve(parts.size());
    for (const auto& p : parts) {
        std::string t;
        for (char c : textutil::to_lower(textutil::trim(p))) {
            if (c != '.') t.push_back(c);
        }
        if (!t.empty()) cleaned.push_back(std::move(t));
    }

    // "Nguyen, Clare M.": a trailing initial after "Last, First"
    if (raw.find(',') != std::string::npos && cleaned.size() > 2 && cleaned.back().size() == 1) {
        cleaned.pop_back();
    }

    // single letters between first and last are middle initials
    std::vector<std::string> out;
    out.reserve(cleaned.size());
    for (size_t i = 0; i < cleaned.size(); ++i) {
        const bool middle = i > 0 && i + 1 < cleaned.size();
        if (middle && cleaned[i].size() == 1) continue;
        out.push_back(cleaned[i]);
    }
    return out;
}

}  // namespace names
