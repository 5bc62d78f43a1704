#include "commands/rating.hpp"
#include "commands/Args.hpp"

#include "net/CurlHttpClient.hpp"
#include "ratings/RatingResolver.hpp"

#include <iostream>
#include <string>

int cmd_rating(int argc, char** argv) {
    try {
        const std::string name = cli::require_arg(argc, argv, "--name");

        ratings::RatingConfig cfg;
        cfg.school_id = cli::get_arg(argc, argv, "--school_id", cfg.school_id);
        cfg.timeout_secs = cli::get_arg_int(argc, argv, "--timeout", cfg.timeout_secs);

        net::CurlHttpClient client;
        ratings::RatingResolver resolver(client, cfg);
        const auto r = resolver.lookup(name);

        std::cout << "PROFESSOR: " << name << "\n";
        if (!r) {
            std::cout << "RATING: not found\n";
            return 0;
        }

        std::cout << "RATING: ";
        if (r->score) std::cout << *r->score; else std::cout << "n/a";
        std::cout << "\nNUM_RATINGS: ";
        if (r->num_ratings) std::cout << *r->num_ratings; else std::cout << "n/a";
        std::cout << "\nDIFFICULTY: ";
        if (r->difficulty) std::cout << *r->difficulty; else std::cout << "n/a";
        std::cout << "\n";
        if (r->url) std::cout << "URL: " << *r->url << "\n";
        return 0;
    } catch (const cli::UsageError& e) {
        std::cerr << "rating: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "rating failed: " << e.what() << "\n";
        return 1;
    }
}
