#include "ratings/RatingResolver.hpp"
#include "names/NameMatcher.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <regex>
#include <utility>
#include <vector>

namespace ratings {

static std::optional<double> parse_score(const std::string& raw) {
    const std::string s = textutil::trim(raw);
    if (s.empty()) return std::nullopt;

    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return std::nullopt;
    if (v < 0.0 || v > 5.0) return std::nullopt;
    return v;
}

static std::optional<int> first_int(const std::string& s) {
    static const std::regex re(R"((\d+))");
    std::smatch m;
    if (!std::regex_search(s, m, re)) return std::nullopt;
    try {
        return std::stoi(m[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

static html::Node::Predicate div_class(const char* pattern) {
    auto re = std::make_shared<std::regex>(pattern, std::regex::icase);
    return [re](const html::Node& n) { return n.is_tag("div") && n.class_matches(*re); };
}

static bool mentions_difficulty(const html::Node& n) {
    return textutil::to_lower(n.raw_text()).find("difficulty") != std::string::npos;
}

static std::string card_display_name(const html::Node& card) {
    html::Node name = card.find_first(div_class("CardName"));
    if (!name) {
        name = card.find_first([](const html::Node& n) {
            if (!n.is_tag("div")) return false;
            for (unsigned char c : n.own_text()) {
                if (std::isalpha(c)) return true;
            }
            return false;
        });
    }
    return name ? name.text() : "";
}

// search-results card layout
static void read_card(const html::Node& card, Rating& r) {
    if (html::Node n = card.find_first(div_class("CardNumRating__CardNumRatingNumber"))) {
        r.score = parse_score(n.text());
    }
    if (html::Node n = card.find_first(div_class("CardNumRating__CardNumRatingCount"))) {
        r.num_ratings = first_int(n.text());
    }

    for (const auto& item : card.find_all(div_class("CardFeedback__CardFeedbackItem"))) {
        if (!mentions_difficulty(item)) continue;
        html::Node num = item.find_first(div_class("CardFeedback__CardFeedbackNumber"));
        if (!num) continue;
        if (auto d = parse_score(num.text())) {
            r.difficulty = d;
            break;
        }
    }

    if (!r.difficulty) {
        const auto numbers = card.find_all(div_class("CardFeedback__CardFeedbackNumber"));
        if (numbers.size() >= 2) {
            for (const auto& num : numbers) {
                html::Node parent = num.parent();
                if (!parent || !mentions_difficulty(parent)) continue;
                if (auto d = parse_score(num.text())) {
                    r.difficulty = d;
                    break;
                }
            }
        }
    }
}

// full profile page layout, used for whatever the card did not carry
static void read_profile_page(const html::Document& doc, Rating& r) {
    if (!r.score) {
        if (html::Node n = doc.find_first(div_class("RatingValue__Numerator"))) r.score = parse_score(n.text());
    }

    if (!r.num_ratings) {
        html::Node link = doc.find_first([](const html::Node& n) {
            return n.is_tag("a") && n.attr("href") == "#ratingsList";
        });
        if (link) r.num_ratings = first_int(link.text());
    }

    if (!r.difficulty) {
        for (const auto& item : doc.find_all(div_class("FeedbackItem"))) {
            if (!mentions_difficulty(item)) continue;
            html::Node num = item.find_first(div_class("FeedbackItem__FeedbackNumber"));
            if (!num) continue;
            if (auto d = parse_score(num.text())) {
                r.difficulty = d;
                break;
            }
        }
    }

    if (!r.difficulty) {
        const auto numbers = doc.find_all(div_class("FeedbackItem__FeedbackNumber"));
        if (numbers.size() >= 2) r.difficulty = parse_score(numbers[1].text());
    }
}

RatingResolver::RatingResolver(net::HttpClient& client, RatingConfig cfg)
    : client_(client), cfg_(std::move(cfg)) {}

std::string RatingResolver::search_url(const std::string& professor_name) const {
    return cfg_.search_url + "/" + cfg_.school_id + "?q=" + textutil::url_encode(professor_name);
}

std::optional<Rating> RatingResolver::parse_results(const html::Document& doc, const std::string& professor_name) const {
    static const std::regex card_re("TeacherCard", std::regex::icase);

    std::vector<html::Node> cards = doc.find_all([](const html::Node& n) {
        return n.is_tag("a") && n.class_matches(card_re);
    });
    if (cards.empty()) {
        cards = doc.find_all([](const html::Node& n) {
            return n.is_tag("a") && textutil::contains_ci(n.attr("href"), "/professor/");
        });
    }

    if (cards.empty()) {
        std::cerr << "[ratings] no result cards for '" << professor_name << "'\n";
        return std::nullopt;
    }

    html::Node match;
    std::vector<std::string> seen_names;
    for (const auto& card : cards) {
        const std::string name = card_display_name(card);
        if (name.empty()) continue;
        if (names::match_names(professor_name, name)) {
            std::cerr << "[ratings] matched '" << professor_name << "' with '" << name << "'\n";
            match = card;
            break;
        }
        if (seen_names.size() < 3) seen_names.push_back(name);
    }

    if (!match) {
        if (seen_names.empty()) {
            std::cerr << "[ratings] no match for '" << professor_name << "' (could not read card names)\n";
        } else {
            std::cerr << "[ratings] no match for '" << professor_name << "'. Found: "
                      << textutil::join(seen_names, ", ") << "\n";
        }
        return std::nullopt;
    }

    Rating r;
    const std::string href = match.attr("href");
    if (href.rfind("/professor/", 0) == 0) {
        r.url = cfg_.site_root + href;
    } else if (href.rfind("http", 0) == 0) {
        r.url = href;
    }

    read_card(match, r);
    if (!r.score || !r.num_ratings || !r.difficulty) read_profile_page(doc, r);

    if (r.empty()) return std::nullopt;
    return r;
}

std::optional<Rating> RatingResolver::lookup(const std::string& professor_name) const {
    try {
        const net::HttpResponse resp = client_.get(search_url(professor_name), cfg_.timeout_secs);
        if (resp.status != 200) {
            std::cerr << "[ratings] HTTP " << resp.status << " for " << professor_name;
            if (!resp.error.empty()) std::cerr << " (" << resp.error << ")";
            std::cerr << "\n";
            return std::nullopt;
        }

        const html::Document doc = html::Document::parse(resp.body);
        return parse_results(doc, professor_name);
    } catch (const std::exception& e) {
        std::cerr << "[ratings] lookup failed for " << professor_name << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

}  // namespace ratings
