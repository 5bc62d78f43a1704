#include "commands/conflicts.hpp"
#include "commands/Args.hpp"

#include "io/JsonIO.hpp"
#include "schedule/ConflictDetector.hpp"

#include <iostream>
#include <string>

static std::string days_str(const std::vector<char>& days) {
    std::string out;
    for (char d : days) {
        if (!out.empty()) out += ", ";
        out += schedule::day_name(d);
    }
    return out;
}

int cmd_conflicts(int argc, char** argv) {
    try {
        const std::string path = cli::require_arg(argc, argv, "--sections");
        const std::string out_path = cli::get_arg(argc, argv, "--out", "");

        const auto sections = io::load_sections(path);
        const auto conflicts = schedule::detect_conflicts(sections);

        size_t untimed = 0;
        for (const auto& s : sections) {
            if (!s.time_data) ++untimed;
        }
        if (untimed > 0) {
            std::cerr << "[conflicts] " << untimed << " section(s) without a parseable time were skipped\n";
        }

        if (conflicts.empty()) {
            std::cout << "No schedule conflicts.\n";
        }
        for (const auto& c : conflicts) {
            std::cout << c.first.course << " (" << c.first.crn << ") vs "
                      << c.second.course << " (" << c.second.crn << ") on " << days_str(c.shared_days) << "\n";
            std::cout << "    " << c.first_time << "  /  " << c.second_time << "\n";
        }

        if (!out_path.empty()) io::write_json(out_path, io::conflicts_to_json(conflicts));

        std::cout << "\n";
        std::cout << "SECTIONS: " << sections.size() << "\n";
        std::cout << "CONFLICTS: " << conflicts.size() << "\n";
        if (!out_path.empty()) std::cout << "WROTE: " << out_path << "\n";
        return 0;
    } catch (const cli::UsageError& e) {
        std::cerr << "conflicts: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "conflicts failed: " << e.what() << "\n";
        return 1;
    }
}
