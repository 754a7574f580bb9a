#include <gtest/gtest.h>
#include "../../src/utils/url/url.hpp"

using namespace Reader::Utils;

namespace {
std::string resolved(const std::string& base, const std::string& reference) {
    auto target = Url::resolve(*Url::parse_absolute(base), reference);
    return target ? target->to_string() : "<rejected>";
}
}  // namespace

TEST(UrlTest, RelativeResolveRFC) {
    std::string base = "https://example.com/a/b/c.html";
    EXPECT_EQ(resolved(base, "d.html"), "https://example.com/a/b/d.html");
    EXPECT_EQ(resolved(base, "//google.com/f.html"), "https://google.com/f.html");
    EXPECT_EQ(resolved(base, "../d.html"), "https://example.com/a/d.html");
    EXPECT_EQ(resolved(base, "../../../d.html"), "https://example.com/d.html");
    EXPECT_EQ(resolved(base, "https://other.org/x"), "https://other.org/x");
}

TEST(UrlTest, ResolutionQueryFragment) {
    std::string base = "https://example.com/page?q=1#frag";
    EXPECT_EQ(resolved(base, "other?a=b"), "https://example.com/other?a=b");
    EXPECT_EQ(resolved(base, "?new=view"), "https://example.com/page?new=view");
    EXPECT_EQ(resolved(base, "#newfrag"), "https://example.com/page?q=1#newfrag");
    EXPECT_EQ(resolved(base, ""), "https://example.com/page?q=1");
}

TEST(UrlTest, RedirectKeepsPort) {
    EXPECT_EQ(resolved("http://127.0.0.1:8081/old", "/new.pdf"), "http://127.0.0.1:8081/new.pdf");
    EXPECT_EQ(resolved("http://[::1]:8081/a/old", "new.pdf"), "http://[::1]:8081/a/new.pdf");
}

TEST(UrlTest, RedirectOutsideHttpIsRejected) {
    EXPECT_EQ(resolved("https://example.com/", "ftp://example.com/file"), "<rejected>");
    EXPECT_EQ(resolved("https://example.com/", "javascript:alert(1)"), "<rejected>");
    EXPECT_EQ(resolved("https://example.com/", "//"), "<rejected>");
}

TEST(UrlTest, RequestTargetAndPort) {
    auto a = Url::parse_absolute("https://example.com/docs/file.pdf?v=2#p3");
    ASSERT_TRUE(a.has_value());
    EXPECT_TRUE(a->is_https());
    EXPECT_EQ(a->request_target(), "/docs/file.pdf?v=2");
    EXPECT_EQ(a->effective_port(), "443");

    auto b = Url::parse_absolute("http://example.com:8080");
    ASSERT_TRUE(b.has_value());
    EXPECT_FALSE(b->is_https());
    EXPECT_EQ(b->request_target(), "/");
    EXPECT_EQ(b->effective_port(), "8080");
}

TEST(UrlTest, AbsoluteAcceptsHttpAndHttps) {
    auto a = Url::parse_absolute("https://example.com/article");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->scheme, "https");
    EXPECT_EQ(a->host, "example.com");
    EXPECT_EQ(a->path, "/article");
    EXPECT_EQ(a->to_string(), "https://example.com/article");

    auto b = Url::parse_absolute("HTTP://Example.COM");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->to_string(), "http://example.com/");
}

TEST(UrlTest, AbsoluteRejectsRelativeAndOtherSchemes) {
    EXPECT_FALSE(Url::parse_absolute("/relative/path").has_value());
    EXPECT_FALSE(Url::parse_absolute("example.com/page").has_value());
    EXPECT_FALSE(Url::parse_absolute("ftp://example.com/file").has_value());
    EXPECT_FALSE(Url::parse_absolute("file:///etc/passwd").has_value());
    EXPECT_FALSE(Url::parse_absolute("javascript:alert(1)").has_value());
    EXPECT_FALSE(Url::parse_absolute("").has_value());
}

TEST(UrlTest, AbsoluteRejectsBadHosts) {
    EXPECT_FALSE(Url::parse_absolute("https://").has_value());
    EXPECT_FALSE(Url::parse_absolute("https://exa mple.com").has_value());
    EXPECT_FALSE(Url::parse_absolute("https://example.com:99999/").has_value());
    EXPECT_FALSE(Url::parse_absolute("https://example.com:12ab/").has_value());
    EXPECT_FALSE(Url::parse_absolute("http://[::1/").has_value());
    EXPECT_FALSE(Url::parse_absolute("https%3A%2F%2Fexample.com").has_value());
}

TEST(UrlTest, AbsoluteNormalizes) {
    auto a = Url::parse_absolute("https://example.com:443/a/./b/../c?x=1#top");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->port, "");
    EXPECT_EQ(a->path, "/a/c");
    EXPECT_EQ(a->query, "x=1");
    EXPECT_EQ(a->fragment, "top");
    EXPECT_EQ(a->request_target(), "/a/c?x=1");
    EXPECT_EQ(a->effective_port(), "443");

    auto b = Url::parse_absolute("http://127.0.0.1:8080/doc.pdf");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->port, "8080");
    EXPECT_EQ(b->to_string(), "http://127.0.0.1:8080/doc.pdf");

    auto c = Url::parse_absolute("http://[2001:DB8::1]/");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->host, "[2001:db8::1]");
}

TEST(UrlTest, AbsoluteEncodesSpacesAndUnicode) {
    auto a = Url::parse_absolute("https://example.com/a b/caf\xC3\xA9");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->path, "/a%20b/caf%C3%A9");
}

TEST(UrlTest, PercentDecodeSinglePass) {
    EXPECT_EQ(Url::percent_decode("https%3A%2F%2Fexample.com%2Farticle").value(),
              "https://example.com/article");
    EXPECT_EQ(Url::percent_decode("%252F").value(), "%2F");
    EXPECT_EQ(Url::percent_decode("plain").value(), "plain");
}

TEST(UrlTest, PercentDecodeMalformed) {
    EXPECT_FALSE(Url::percent_decode("%").has_value());
    EXPECT_FALSE(Url::percent_decode("abc%2").has_value());
    EXPECT_FALSE(Url::percent_decode("%zz").has_value());
}
