#include <gtest/gtest.h>

#include "html/Document.hpp"

#include <regex>
#include <stdexcept>

static const char* kPage =
    "<html><head><title> Schedule Listings </title>"
    "<script>var MATH = '1A';</script></head>"
    "<body>"
    "<div class=\"course-listing wide\" id=\"c1\"><span>MATH 1A</span> <b>Lecture</b></div>"
    "<ul><li>Tue <em>MATH 1A lab</em></li></ul>"
    "</body></html>";

TEST(Document, EmptyInputThrows) {
    EXPECT_THROW(html::Document::parse(""), std::runtime_error);
}

TEST(Document, TitleIsTrimmed) {
    const auto doc = html::Document::parse(kPage);
    EXPECT_EQ(doc.title(), "Schedule Listings");
}

TEST(Document, ClassAndAttributeAccess) {
    const auto doc = html::Document::parse(kPage);
    const auto divs = doc.find_all({"div"});
    ASSERT_EQ(divs.size(), 1u);

    EXPECT_TRUE(divs[0].has_class("course-listing"));
    EXPECT_TRUE(divs[0].has_class("wide"));
    EXPECT_FALSE(divs[0].has_class("course"));
    EXPECT_TRUE(divs[0].class_matches(std::regex("listing", std::regex::icase)));
    EXPECT_EQ(divs[0].attr("id"), "c1");
    EXPECT_EQ(divs[0].attr("missing"), "");
}

TEST(Document, TextJoinsStrippedPieces) {
    const auto doc = html::Document::parse(kPage);
    const auto div = doc.find_all({"div"}).at(0);
    EXPECT_EQ(div.text(), "MATH 1ALecture");
    EXPECT_EQ(div.text(" "), "MATH 1A Lecture");
}

TEST(Document, TextSearchSkipsScriptsAndFindsContainer) {
    const auto doc = html::Document::parse(kPage);
    const auto hits = doc.text_nodes_matching(std::regex("math 1a", std::regex::icase));
    ASSERT_EQ(hits.size(), 2u);

    const html::Node li = hits[1].closest({"tr", "div", "li"});
    ASSERT_TRUE(li);
    EXPECT_EQ(li.tag(), "li");
    EXPECT_TRUE(hits[1].is_descendant_of(li));
    EXPECT_FALSE(li.is_descendant_of(hits[1]));
}
