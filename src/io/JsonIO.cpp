#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

// absent or null falls back to def; any other non-string is an error
static std::string optional_string(const json& j, const char* key, const std::string& def, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

template <typename T>
static json or_null(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T>
static std::optional<T> optional_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<T>();
}

static json time_to_json(const schedule::TimeInterval& t) {
    json days = json::array();
    for (char d : t.days) days.push_back(std::string(1, d));

    return json{
        {"days", days},
        {"day_names", t.day_names},
        {"start_time", t.start_text},
        {"end_time", t.end_text},
        {"start_minutes", t.start_minutes},
        {"end_minutes", t.end_minutes},
        {"duration_minutes", t.duration_minutes},
    };
}

static json rating_to_json(const ratings::Rating& r) {
    return json{
        {"rating", or_null(r.score)},
        {"num_ratings", or_null(r.num_ratings)},
        {"difficulty", or_null(r.difficulty)},
        {"url", or_null(r.url)},
    };
}

static ratings::Rating parse_rating(const json& j, const std::string& where) {
    require_object(j, where);

    ratings::Rating r;
    r.score = optional_number<double>(j, "rating", where);
    r.num_ratings = optional_number<int>(j, "num_ratings", where);
    r.difficulty = optional_number<double>(j, "difficulty", where);
    if (j.contains("url") && !j.at("url").is_null()) r.url = optional_string(j, "url", "", where);
    return r;
}

static listing::CourseSection parse_section(const json& j, const std::string& where) {
    require_object(j, where);

    listing::CourseSection s;
    s.course = optional_string(j, "course", "", where);
    s.crn = optional_string(j, "crn", listing::kNoCrn, where);
    s.professor = optional_string(j, "professor", listing::kTba, where);
    s.class_time = optional_string(j, "class_time", listing::kTba, where);
    if (s.professor.empty()) s.professor = listing::kTba;
    if (s.class_time.empty()) s.class_time = listing::kTba;
    if (s.crn.empty()) s.crn = listing::kNoCrn;
    s.format = listing::format_from_str(optional_string(j, "format", "Unknown", where));
    s.time_data = schedule::parse_time(s.class_time);

    if (j.contains("ratings") && !j.at("ratings").is_null()) {
        s.ratings = parse_rating(j.at("ratings"), where + ".ratings");
    }
    return s;
}

static json ref_to_json(const schedule::SectionRef& r) {
    return json{{"crn", r.crn}, {"course", r.course}, {"professor", r.professor}};
}

json section_to_json(const listing::CourseSection& s) {
    json j{
        {"course", s.course},
        {"crn", s.crn},
        {"professor", s.professor},
        {"class_time", s.class_time},
        {"format", listing::format_str(s.format)},
    };
    if (s.time_data) j["time_data"] = time_to_json(*s.time_data);
    j["ratings"] = s.ratings ? rating_to_json(*s.ratings) : json(nullptr);
    return j;
}

json sections_to_json(const std::vector<listing::CourseSection>& sections) {
    json arr = json::array();
    for (const auto& s : sections) arr.push_back(section_to_json(s));
    return arr;
}

json conflict_to_json(const schedule::Conflict& c) {
    json days = json::array();
    for (char d : c.shared_days) days.push_back(std::string(1, d));

    return json{
        {"course1", ref_to_json(c.first)},
        {"course2", ref_to_json(c.second)},
        {"conflicting_days", days},
        {"time1", c.first_time},
        {"time2", c.second_time},
    };
}

json conflicts_to_json(const std::vector<schedule::Conflict>& conflicts) {
    json arr = json::array();
    for (const auto& c : conflicts) arr.push_back(conflict_to_json(c));
    return arr;
}

std::vector<listing::CourseSection> sections_from_json(const json& j, const std::string& where) {
    const json* arr = &j;
    std::string arr_where = where;
    if (j.is_object()) {
        if (!j.contains("courses")) {
            throw std::runtime_error(where + " missing required field: courses");
        }
        arr = &j.at("courses");
        arr_where = where + ".courses";
    }
    require_array(*arr, arr_where);

    std::vector<listing::CourseSection> out;
    out.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        std::ostringstream oss;
        oss << arr_where << "[" << i << "]";
        out.push_back(parse_section(arr->at(i), oss.str()));
    }
    return out;
}

std::vector<listing::CourseSection> load_sections(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open sections file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }

    try {
        return sections_from_json(j, "root");
    } catch (const json::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

void write_json(const std::string& path, const json& j) {
    const fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    std::ofstream out(p, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("failed to open output file: " + path);
    }
    out << j.dump(2) << "\n";
}

}  // namespace io
