#include <gtest/gtest.h>
#include <gumbo.h>
#include "../../src/transform/html_transformer.hpp"
#include "../../src/transform/readability.hpp"

using namespace Reader::Transform;

namespace {
const char* kArticlePage = R"(
<html>
<head><title>Story</title><script>var tracking = 1;</script></head>
<body>
  <nav><a href="/">Home</a> <a href="/about">About us</a></nav>
  <div class="cookie-banner" id="cookies">We use cookies to improve your experience.</div>
  <article>
    <h1>The Long Story</h1>
    <p>The first paragraph has enough words in it, with commas, to count as prose.</p>
    <p>A second paragraph keeps going, adding more text, so the article clearly wins.</p>
    <div class="share">Share on every network</div>
  </article>
  <footer>Copyright 2024 Example Corp</footer>
</body>
</html>)";
}  // namespace

TEST(HtmlTransformerTest, PlainText) {
    EXPECT_EQ(HtmlTransformer::to_markdown("Hello world"), "Hello world");
}

TEST(HtmlTransformerTest, MinimalDocumentHasNoTags) {
    std::string md = HtmlTransformer::to_markdown("<html><body><p>Hello world</p></body></html>");
    EXPECT_NE(md.find("Hello world"), std::string::npos);
    EXPECT_EQ(md.find('<'), std::string::npos);
    EXPECT_EQ(md.find('>'), std::string::npos);
}

TEST(HtmlTransformerTest, ContentHintOutweighsChromeHint) {
    std::string md = HtmlTransformer::to_markdown(R"(
<html><body>
  <div class="post-body comments-enabled">
    <p>The experiment ran for three weeks, and the results, while noisy, were consistent.</p>
    <p>Every sample was measured twice, by different people, on different instruments.</p>
  </div>
  <div class="author-bio">
    <p>About the author: Jane writes about science, daily.</p>
  </div>
</body></html>)");

    EXPECT_NE(md.find("The experiment ran"), std::string::npos);
    EXPECT_NE(md.find("measured twice"), std::string::npos);
    EXPECT_EQ(md.find("About the author"), std::string::npos);
}

TEST(HtmlTransformerTest, KeepsArticleDropsChrome) {
    std::string md = HtmlTransformer::to_markdown(kArticlePage);

    EXPECT_NE(md.find("The Long Story"), std::string::npos);
    EXPECT_NE(md.find("first paragraph"), std::string::npos);
    EXPECT_NE(md.find("second paragraph"), std::string::npos);

    EXPECT_EQ(md.find("About us"), std::string::npos);
    EXPECT_EQ(md.find("Copyright"), std::string::npos);
    EXPECT_EQ(md.find("cookies"), std::string::npos);
    EXPECT_EQ(md.find("Share on"), std::string::npos);
    EXPECT_EQ(md.find("tracking"), std::string::npos);
}

TEST(HtmlTransformerTest, HeadingsAndLinks) {
    std::string md = HtmlTransformer::serialize_markdown(
        "<h1>Title</h1><p>See <a href=\"https://example.com/docs\">the docs</a>.</p>");
    EXPECT_NE(md.find("# Title"), std::string::npos);
    EXPECT_NE(md.find("[the docs](https://example.com/docs)"), std::string::npos);
}

TEST(HtmlTransformerTest, FencedCode) {
    std::string md = HtmlTransformer::serialize_markdown(
        "<pre><code>int main() { return 0; }</code></pre>");
    EXPECT_NE(md.find("```"), std::string::npos);
    EXPECT_NE(md.find("int main()"), std::string::npos);
}

TEST(HtmlTransformerTest, MalformedMarkup) {
    std::string md;
    EXPECT_NO_THROW(md = HtmlTransformer::to_markdown("<div><p>Unclosed <b>bold text"));
    EXPECT_NE(md.find("Unclosed"), std::string::npos);
    EXPECT_NE(md.find("bold text"), std::string::npos);
}

TEST(HtmlTransformerTest, EmptyInput) {
    EXPECT_NO_THROW(HtmlTransformer::to_markdown(""));
    EXPECT_NO_THROW(HtmlTransformer::to_markdown("<<<>>>"));
}

TEST(ReadabilityTest, BoilerplateDetection) {
    GumboOutput* out = gumbo_parse(
        "<nav>n</nav><div role=\"navigation\">r</div><div class=\"ad-slot ad\">a</div>"
        "<div class=\"header-wrap\">h</div><article class=\"ad\">x</article>"
        "<div class=\"comments main-content\">c</div>");
    const GumboNode* body =
        static_cast<const GumboNode*>(out->root->v.element.children.data[1]);
    const GumboVector& kids = body->v.element.children;

    EXPECT_TRUE(Readability::is_boilerplate(static_cast<const GumboNode*>(kids.data[0])));
    EXPECT_TRUE(Readability::is_boilerplate(static_cast<const GumboNode*>(kids.data[1])));
    EXPECT_TRUE(Readability::is_boilerplate(static_cast<const GumboNode*>(kids.data[2])));
    EXPECT_FALSE(Readability::is_boilerplate(static_cast<const GumboNode*>(kids.data[3])));
    EXPECT_FALSE(Readability::is_boilerplate(static_cast<const GumboNode*>(kids.data[4])));
    EXPECT_FALSE(Readability::is_boilerplate(static_cast<const GumboNode*>(kids.data[5])));

    gumbo_destroy_output(&kGumboDefaultOptions, out);
}

TEST(ReadabilityTest, MainFallback) {
    GumboOutput* out = gumbo_parse(
        "<body><nav>Menu</nav><main><h2>Short</h2><ul><li>one</li></ul></main></body>");
    auto fragment = Readability::extract(out->root);
    ASSERT_TRUE(fragment.has_value());
    EXPECT_NE(fragment->find("<main>"), std::string::npos);
    EXPECT_EQ(fragment->find("Menu"), std::string::npos);
    gumbo_destroy_output(&kGumboDefaultOptions, out);
}

TEST(ReadabilityTest, NothingReadable) {
    GumboOutput* out = gumbo_parse("<body><nav>Menu</nav><footer>Foot</footer></body>");
    EXPECT_FALSE(Readability::extract(out->root).has_value());
    gumbo_destroy_output(&kGumboDefaultOptions, out);
}

TEST(ReadabilityTest, SerializeDropsScriptsAndHandlers) {
    GumboOutput* out = gumbo_parse(
        "<div onclick=\"x()\" class=\"c\"><script>bad()</script><p>a &amp; b</p></div>");
    std::string html = Readability::serialize(out->root, false);
    EXPECT_EQ(html.find("script"), std::string::npos);
    EXPECT_EQ(html.find("onclick"), std::string::npos);
    EXPECT_NE(html.find("class=\"c\""), std::string::npos);
    EXPECT_NE(html.find("a &amp; b"), std::string::npos);
    gumbo_destroy_output(&kGumboDefaultOptions, out);
}
