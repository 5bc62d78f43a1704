#include "commands/search.hpp"
#include "commands/Args.hpp"

#include "io/JsonIO.hpp"
#include "listing/CourseQuery.hpp"
#include "net/CurlHttpClient.hpp"
#include "net/Fetcher.hpp"
#include "ratings/RatingBatch.hpp"
#include "ratings/RatingResolver.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void print_section(size_t index, const listing::CourseSection& s) {
    std::cout << "[" << index << "] CRN " << s.crn << "  " << s.course << "  " << s.professor << "\n";
    std::cout << "    " << s.class_time << "  (" << listing::format_str(s.format) << ")\n";

    if (!s.ratings) return;
    const ratings::Rating& r = *s.ratings;
    std::cout << "    rating ";
    if (r.score) std::cout << std::fixed << std::setprecision(1) << *r.score << "/5";
    else std::cout << "n/a";
    if (r.num_ratings) std::cout << " (" << *r.num_ratings << " ratings)";
    if (r.difficulty) std::cout << ", difficulty " << std::fixed << std::setprecision(1) << *r.difficulty;
    std::cout << "\n";
    if (r.url) std::cout << "    " << *r.url << "\n";
}

int cmd_search(int argc, char** argv) {
    try {
        const std::string course_arg = cli::require_arg(argc, argv, "--course");
        const std::string term = cli::require_arg(argc, argv, "--term");

        const auto course = listing::parse_course_input(course_arg);
        if (!course) throw cli::UsageError("--course must look like \"MATH 1A\", got '" + course_arg + "'");
        if (!listing::is_valid_term(term)) throw cli::UsageError("--term must look like W2026, got '" + term + "'");

        net::FetcherConfig fcfg;
        fcfg.max_retries = cli::get_arg_int(argc, argv, "--max_retries", fcfg.max_retries);
        fcfg.base_delay_secs = cli::get_arg_int(argc, argv, "--retry_delay", fcfg.base_delay_secs);
        fcfg.timeout_secs = cli::get_arg_int(argc, argv, "--timeout", fcfg.timeout_secs);
        if (fcfg.max_retries < 1) throw cli::UsageError("--max_retries must be at least 1");

        ratings::RatingConfig rcfg;
        rcfg.school_id = cli::get_arg(argc, argv, "--school_id", rcfg.school_id);
        rcfg.timeout_secs = fcfg.timeout_secs;

        listing::ParseOptions popt;
        popt.debug_dir = cli::get_arg(argc, argv, "--debug_dir", "");
        popt.save_html_path = cli::get_arg(argc, argv, "--save_html", "");

        const bool with_ratings = !cli::has_flag(argc, argv, "--no_ratings");
        const std::string out_path = cli::get_arg(argc, argv, "--out", "");

        net::CurlHttpClient client;
        net::Fetcher fetcher(client, fcfg);

        std::vector<listing::CourseSection> sections =
            listing::search_course(fetcher, course->first, course->second, term, popt);

        if (sections.empty()) {
            std::cout << "No sections found for " << course->first << " " << course->second << " in " << term << "\n";
        } else {
            if (with_ratings) {
                ratings::RatingResolver resolver(client, rcfg);
                ratings::attach_ratings(sections, resolver);
                ratings::sort_by_rating(sections);
            }
            for (size_t i = 0; i < sections.size(); ++i) print_section(i + 1, sections[i]);
        }

        size_t rated = 0;
        for (const auto& s : sections) {
            if (s.ratings) ++rated;
        }

        if (!out_path.empty()) io::write_json(out_path, io::sections_to_json(sections));

        std::cout << "\n";
        std::cout << "COURSE: " << course->first << " " << course->second << "\n";
        std::cout << "TERM: " << term << "\n";
        std::cout << "SECTIONS: " << sections.size() << "\n";
        if (with_ratings) std::cout << "RATED: " << rated << "\n";
        if (!out_path.empty()) std::cout << "WROTE: " << out_path << "\n";
        return 0;
    } catch (const cli::UsageError& e) {
        std::cerr << "search: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "search failed: " << e.what() << "\n";
        return 1;
    }
}
