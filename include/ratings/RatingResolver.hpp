#pragma once
#include <optional>
#include <string>

#include "html/Document.hpp"
#include "net/HttpClient.hpp"
#include "ratings/Rating.hpp"

namespace ratings {

struct RatingConfig {
    std::string search_url = "https://www.ratemyprofessors.com/search/professors";
    std::string site_root = "https://www.ratemyprofessors.com";
    std::string school_id = "1967";
    int timeout_secs = 15;
};

// Looks up one professor's public rating profile. A miss of any kind is
// std::nullopt, never an exception.
class RatingResolver {
public:
    explicit RatingResolver(net::HttpClient& client, RatingConfig cfg = {});

    // {search_url}/{school_id}?q={url_encoded_name}
    std::string search_url(const std::string& professor_name) const;

    std::optional<Rating> lookup(const std::string& professor_name) const;

    // parses an already fetched search-results (or profile) page
    std::optional<Rating> parse_results(const html::Document& doc, const std::string& professor_name) const;

    const RatingConfig& config() const { return cfg_; }

private:
    net::HttpClient& client_;
    RatingConfig cfg_;
};

}  // namespace ratings
