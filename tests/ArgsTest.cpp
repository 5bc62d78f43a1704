#include <gtest/gtest.h>

#include "commands/Args.hpp"

#include <string>
#include <vector>

class ArgsTest : public ::testing::Test {
protected:
    std::vector<std::string> storage;
    std::vector<char*> argv;

    void set(std::vector<std::string> args) {
        storage = std::move(args);
        argv.clear();
        for (auto& s : storage) argv.push_back(&s[0]);
    }
    int argc() const { return static_cast<int>(argv.size()); }
};

TEST_F(ArgsTest, ReadsValuesAndFlags) {
    set({"search", "--course", "MATH 1A", "--term", "W2026", "--no_ratings"});

    EXPECT_EQ(cli::get_arg(argc(), argv.data(), "--course", ""), "MATH 1A");
    EXPECT_EQ(cli::get_arg(argc(), argv.data(), "--out", "none"), "none");
    EXPECT_TRUE(cli::has_flag(argc(), argv.data(), "--no_ratings"));
    EXPECT_FALSE(cli::has_flag(argc(), argv.data(), "--debug_dir"));
    EXPECT_EQ(cli::require_arg(argc(), argv.data(), "--term"), "W2026");
}

TEST_F(ArgsTest, IntegerFlags) {
    set({"search", "--max_retries", "5", "--timeout", "ten"});

    EXPECT_EQ(cli::get_arg_int(argc(), argv.data(), "--max_retries", 3), 5);
    EXPECT_EQ(cli::get_arg_int(argc(), argv.data(), "--retry_delay", 2), 2);
    EXPECT_THROW(cli::get_arg_int(argc(), argv.data(), "--timeout", 15), cli::UsageError);
}

TEST_F(ArgsTest, MissingRequiredIsUsageError) {
    set({"conflicts"});
    EXPECT_THROW(cli::require_arg(argc(), argv.data(), "--sections"), cli::UsageError);
}
