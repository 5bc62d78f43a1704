#include "commands/conflicts.hpp"
#include "commands/parse.hpp"
#include "commands/rating.hpp"
#include "commands/search.hpp"

#include <iostream>
#include <string>

static int print_usage(int code) {
    std::cerr
        << "usage:\n"
        << "  section-scout search --course \"<DEPT CODE>\" --term <TERM> [options]\n"
        << "  section-scout parse --html <file> --course \"<DEPT CODE>\" [options]\n"
        << "  section-scout rating --name \"<professor>\" [options]\n"
        << "  section-scout conflicts --sections <json> [options]\n"
        << "  section-scout help\n"
        << "\n"
        << "  section-scout <command> --help   for command options\n";
    return code;
}

static int print_search_help() {
    std::cerr
        << "usage:\n"
        << "  section-scout search --course \"MATH 1A\" --term W2026 [options]\n"
        << "\n"
        << "required:\n"
        << "  --course <str>               department and course code\n"
        << "  --term <str>                 letters + 4-digit year, e.g. W2026, F2025\n"
        << "\n"
        << "fetch:\n"
        << "  --max_retries <n>            default: 3 (total attempts)\n"
        << "  --retry_delay <s>            default: 2 (waits 2s, 4s, ...)\n"
        << "  --timeout <s>                default: 15 per request\n"
        << "  --debug_dir <dir>            dump the page here if the course is missing\n"
        << "  --save_html <path>           always dump the fetched page\n"
        << "\n"
        << "ratings:\n"
        << "  --no_ratings                 skip professor rating lookups\n"
        << "  --school_id <id>             default: 1967 (De Anza College)\n"
        << "\n"
        << "output:\n"
        << "  --out <path>                 write sections as JSON\n";
    return 0;
}

static int print_parse_help() {
    std::cerr
        << "usage:\n"
        << "  section-scout parse --html <file> --course \"MATH 1A\" [options]\n"
        << "\n"
        << "options:\n"
        << "  --debug_dir <dir>            dump the page here if the course is missing\n"
        << "  --out <path>                 write sections as JSON\n";
    return 0;
}

static int print_rating_help() {
    std::cerr
        << "usage:\n"
        << "  section-scout rating --name \"Clare Nguyen\" [options]\n"
        << "\n"
        << "options:\n"
        << "  --school_id <id>             default: 1967\n"
        << "  --timeout <s>                default: 15\n";
    return 0;
}

static int print_conflicts_help() {
    std::cerr
        << "usage:\n"
        << "  section-scout conflicts --sections <json> [options]\n"
        << "\n"
        << "  <json> is an array of sections or {\"courses\": [...]}, as written by search --out\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 write conflicts as JSON\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage(2);

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") return print_usage(0);

    // subcommand help
    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "search"    && wants_help) return print_search_help();
    if (cmd == "parse"     && wants_help) return print_parse_help();
    if (cmd == "rating"    && wants_help) return print_rating_help();
    if (cmd == "conflicts" && wants_help) return print_conflicts_help();

    if (cmd == "search")    return cmd_search(argc - 1, argv + 1);
    if (cmd == "parse")     return cmd_parse(argc - 1, argv + 1);
    if (cmd == "rating")    return cmd_rating(argc - 1, argv + 1);
    if (cmd == "conflicts") return cmd_conflicts(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage(2);
}
