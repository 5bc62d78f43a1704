#include "text/TextUtil.hpp"
#include <cctype>

namespace textutil {

static bool is_space_at(const std::string& s, size_t i, size_t& width) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (std::isspace(c)) {
        width = 1;
        return true;
    }
    // U+00A0 arrives from &nbsp; as the UTF-8 pair C2 A0
    if (c == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xA0) {
        width = 2;
        return true;
    }
    return false;
}

std::string trim(const std::string& s) {
    size_t i = 0;
    size_t w = 0;
    while (i < s.size() && is_space_at(s, i, w)) i += w;

    size_t j = s.size();
    while (j > i) {
        unsigned char c = static_cast<unsigned char>(s[j - 1]);
        if (std::isspace(c)) {
            --j;
        } else if (c == 0xA0 && j >= i + 2 && static_cast<unsigned char>(s[j - 2]) == 0xC2) {
            j -= 2;
        } else {
            break;
        }
    }
    return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string to_upper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    size_t i = 0;
    size_t w = 0;

    while (i < s.size()) {
        if (is_space_at(s, i, w)) {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
            i += w;
            continue;
        }
        cur.push_back(s[i]);
        ++i;
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_upper(haystack).find(to_upper(needle)) != std::string::npos;
}

bool has_digit(const std::string& s) {
    for (unsigned char c : s) {
        if (std::isdigit(c)) return true;
    }
    return false;
}

std::string fold_nbsp(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (static_cast<unsigned char>(s[i]) == 0xC2 && i + 1 < s.size() &&
            static_cast<unsigned char>(s[i + 1]) == 0xA0) {
            out.push_back(' ');
            ++i;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::string url_encode(const std::string& s) {
    const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);

    for (unsigned char c : s) {
        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '/';

        if (keep) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

}
