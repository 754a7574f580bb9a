#include <gtest/gtest.h>
#include "../../src/utils/text/string_utils.hpp"

using namespace Reader::Utils::Text;

TEST(TextTest, Trim) {
    EXPECT_EQ(trim("  hello \n\t"), "hello");
    EXPECT_EQ(trim("\r\n\r\n"), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(TextTest, CaseHelpers) {
    EXPECT_EQ(to_lower("Application/PDF"), "application/pdf");
    EXPECT_TRUE(contains_icase("Application/PDF; charset=binary", "application/pdf"));
    EXPECT_FALSE(contains_icase("text/html", "application/pdf"));
    EXPECT_TRUE(starts_with("https://x", "https://"));
    EXPECT_FALSE(starts_with("http", "https"));
    EXPECT_TRUE(ends_with("file.pdf", ".pdf"));
}

TEST(TextTest, ReplaceIcaseStripsHeadlessMarker) {
    std::string ua =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) HeadlessChrome/120.0.0.0 Safari/537.36";
    std::string cleaned = replace_icase(ua, "Headless", "");
    EXPECT_EQ(cleaned.find("Headless"), std::string::npos);
    EXPECT_NE(cleaned.find(" Chrome/120.0.0.0"), std::string::npos);

    EXPECT_EQ(replace_icase("HEADLESS headless HeAdLeSs", "headless", "x"), "x x x");
    EXPECT_EQ(replace_icase("nothing here", "headless", ""), "nothing here");
}

TEST(TextTest, Split) {
    auto parts = split("/usr/bin::/bin", ':');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "/usr/bin");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "/bin");
}
