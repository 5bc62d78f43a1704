#include "commands/parse.hpp"
#include "commands/Args.hpp"

#include "html/Document.hpp"
#include "io/JsonIO.hpp"
#include "listing/CourseQuery.hpp"
#include "listing/ListingParser.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open HTML file: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int cmd_parse(int argc, char** argv) {
    try {
        const std::string html_path = cli::require_arg(argc, argv, "--html");
        const std::string course_arg = cli::require_arg(argc, argv, "--course");
        const std::string out_path = cli::get_arg(argc, argv, "--out", "");

        const auto course = listing::parse_course_input(course_arg);
        if (!course) throw cli::UsageError("--course must look like \"MATH 1A\", got '" + course_arg + "'");
        const std::string needle = course->first + " " + course->second;

        listing::ParseOptions popt;
        popt.debug_dir = cli::get_arg(argc, argv, "--debug_dir", "");

        const html::Document doc = html::Document::parse(read_file(html_path));
        listing::ListingParser parser;
        std::vector<listing::CourseSection> sections = parser.parse(doc, needle, popt);
        listing::attach_time_data(sections);

        for (const auto& s : sections) {
            std::cout << s.crn << "\t" << s.professor << "\t" << s.class_time << "\t"
                      << listing::format_str(s.format) << "\n";
        }

        if (!out_path.empty()) io::write_json(out_path, io::sections_to_json(sections));

        std::cout << "\n";
        std::cout << "COURSE: " << needle << "\n";
        std::cout << "SECTIONS: " << sections.size() << "\n";
        if (!out_path.empty()) std::cout << "WROTE: " << out_path << "\n";
        return 0;
    } catch (const cli::UsageError& e) {
        std::cerr << "parse: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "parse failed: " << e.what() << "\n";
        return 1;
    }
}
