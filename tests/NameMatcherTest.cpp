#include <gtest/gtest.h>

#include "names/NameMatcher.hpp"
#include "names/NameNormalizer.hpp"

using Tokens = std::vector<std::string>;

TEST(NameNormalizer, DropsMiddleInitialsAndPeriods) {
    EXPECT_EQ(names::normalize_name("Clare M. Nguyen"), (Tokens{"clare", "nguyen"}));
    EXPECT_EQ(names::normalize_name("J. R. Smith"), (Tokens{"j", "smith"}));
}

TEST(NameNormalizer, CommaOrderIsKeptAsWritten) {
    EXPECT_EQ(names::normalize_name("Nguyen, Clare"), (Tokens{"nguyen", "clare"}));
}

TEST(NameNormalizer, StripsParentheticals) {
    EXPECT_EQ(names::strip_parentheticals("Roderic (Rick) Taylor"), "Roderic  Taylor");
    EXPECT_EQ(names::normalize_name("Roderic (Rick) Taylor"), (Tokens{"roderic", "taylor"}));
}

TEST(NameNormalizer, SplitsGluedInitial) {
    EXPECT_EQ(names::split_glued_initials("Christopher N.Bradley"), "Christopher N. Bradley");
    EXPECT_EQ(names::normalize_name("Christopher N.Bradley"), (Tokens{"christopher", "bradley"}));
}

TEST(NameNormalizer, SplitsGluedNamesKeepingPrefixes) {
    EXPECT_EQ(names::split_glued_name("RodericTaylor"), (Tokens{"Roderic", "Taylor"}));
    EXPECT_EQ(names::split_glued_name("MorganMcKnight"), (Tokens{"Morgan", "McKnight"}));
    EXPECT_EQ(names::split_glued_name("rodericTaylor"), (Tokens{"roderic", "Taylor"}));
    EXPECT_EQ(names::split_glued_name("Taylor"), (Tokens{"Taylor"}));
}

TEST(NameNormalizer, MergesPrefixesWithFollowingPiece) {
    EXPECT_EQ(names::merge_name_prefixes({"Anna", "Van", "Dyke"}), (Tokens{"Anna", "VanDyke"}));
    EXPECT_EQ(names::merge_name_prefixes({"Anna", "Mc"}), (Tokens{"Anna", "Mc"}));
}

TEST(NameMatcher, MiddleInitialIgnored) {
    EXPECT_TRUE(names::match_names("Clare Nguyen", "Clare M. Nguyen"));
}

TEST(NameMatcher, DifferentFirstNameRejected) {
    EXPECT_FALSE(names::match_names("Clare Nguyen", "John Nguyen"));
}

TEST(NameMatcher, GluedDisplayName) {
    EXPECT_TRUE(names::match_names("Roderic Taylor", "RodericTaylor"));
    EXPECT_TRUE(names::match_names("Morgan McKnight", "MorganMcKnight"));
}

TEST(NameMatcher, GluedMiddleInitial) {
    EXPECT_TRUE(names::match_names("Christopher Bradley", "Christopher N.Bradley"));
}

TEST(NameMatcher, LastFirstOrderMatchesCrosswise) {
    EXPECT_TRUE(names::match_names("Nguyen, Clare", "Clare Nguyen"));
}

TEST(NameMatcher, TrailingInitialInLastFirstOrder) {
    EXPECT_EQ(names::normalize_name("Nguyen, Clare M."), (Tokens{"nguyen", "clare"}));
    EXPECT_TRUE(names::match_names("Clare Nguyen", "Nguyen, Clare M."));
    EXPECT_FALSE(names::match_names("John Nguyen", "Nguyen, Clare M."));
}

TEST(NameMatcher, CaseInsensitive) {
    EXPECT_TRUE(names::match_names("clare nguyen", "CLARE NGUYEN"));
}

TEST(NameMatcher, SingleTokenNeverMatches) {
    EXPECT_FALSE(names::match_names("Nguyen", "Nguyen"));
    EXPECT_FALSE(names::match_names("", "Clare Nguyen"));
}
