#include <vieweval/dom/html_document.hpp>
#include <gtest/gtest.h>
#include <string>

namespace vd = vieweval::dom;
namespace vc = vieweval::core;

namespace {

constexpr const char* kPage = R"(<!DOCTYPE html>
<html>
<head>
  <meta charset="utf-8">
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <style>p { line-height: 1.6; }</style>
  <title>Test</title>
</head>
<body>
  <div id="main">
    <p>First paragraph</p>
    <p>Second <a href="/x">link</a></p>
  </div>
  <div>
    <span>loose</span>
    <script>var x = "not text";</script>
  </div>
  <div class="card  wide">direct text</div>
</body>
</html>)";

}  // namespace

TEST(HtmlDocument, EmptyInputIsExtractionError) {
  auto doc = vd::HtmlDocument::parse("");
  ASSERT_FALSE(doc.has_value());
  EXPECT_EQ(doc.error(), vc::EvalError::ExtractionError);
  EXPECT_FALSE(vd::HtmlDocument::parse("   \n\t").has_value());
}

TEST(HtmlDocument, RecordsViewportMetaAndStyleSheets) {
  auto doc = vd::HtmlDocument::parse(kPage);
  ASSERT_TRUE(doc.has_value());
  ASSERT_TRUE(doc->meta_viewport().has_value());
  EXPECT_EQ(*doc->meta_viewport(), "width=device-width, initial-scale=1");
  ASSERT_EQ(doc->style_sheets().size(), 1u);
  EXPECT_NE(doc->style_sheets()[0].find("line-height"), std::string::npos);
}

TEST(HtmlDocument, ElementPathsFollowCssPathRules) {
  auto doc = vd::HtmlDocument::parse(kPage);
  ASSERT_TRUE(doc.has_value());
  ASSERT_FALSE(doc->elements().empty());
  EXPECT_EQ(doc->elements().front().path, "body");

  // An id resets the path.
  EXPECT_NE(doc->find("div#main"), nullptr);
  EXPECT_NE(doc->find("div#main > p:nth-of-type(1)"), nullptr);
  EXPECT_NE(doc->find("div#main > p:nth-of-type(2) > a:nth-of-type(1)"), nullptr);
  // Siblings are counted per tag; body children have no "body" prefix.
  EXPECT_NE(doc->find("div:nth-of-type(2) > span:nth-of-type(1)"), nullptr);
  EXPECT_NE(doc->find("div:nth-of-type(3)"), nullptr);

  // A repeated id keeps the first element; later ones get positional paths.
  auto dup = vd::HtmlDocument::parse(
      R"(<html><body><img id="hero" src="a.png"><img id="hero" src="b.png"></body></html>)");
  ASSERT_TRUE(dup.has_value());
  ASSERT_EQ(dup->elements().size(), 3u);
  EXPECT_EQ(dup->elements()[1].path, "img#hero");
  EXPECT_EQ(dup->elements()[2].path, "img:nth-of-type(2)");
  const auto* first = dup->find("img#hero");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->attributes.at("src"), "a.png");
  const auto* second = dup->find("img:nth-of-type(2)");
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->attributes.at("src"), "b.png");
}

TEST(HtmlDocument, TextAndAttributes) {
  auto doc = vd::HtmlDocument::parse(kPage);
  ASSERT_TRUE(doc.has_value());

  const auto* p2 = doc->find("div#main > p:nth-of-type(2)");
  ASSERT_NE(p2, nullptr);
  EXPECT_EQ(p2->tag, "p");
  EXPECT_EQ(p2->text, "Second link");
  EXPECT_TRUE(p2->has_direct_text);

  const auto* link = doc->find("div#main > p:nth-of-type(2) > a:nth-of-type(1)");
  ASSERT_NE(link, nullptr);
  EXPECT_EQ(link->attribute_or_empty("href"), "/x");
  ASSERT_TRUE(link->parent.has_value());
  EXPECT_EQ(&doc->elements()[*link->parent], p2);

  const auto* main = doc->find("div#main");
  ASSERT_NE(main, nullptr);
  EXPECT_FALSE(main->has_direct_text);

  const auto* card = doc->find("div:nth-of-type(3)");
  ASSERT_NE(card, nullptr);
  EXPECT_TRUE(card->has_class("card"));
  EXPECT_TRUE(card->has_class("wide"));
  EXPECT_FALSE(card->has_class("car"));
  EXPECT_TRUE(card->has_direct_text);
}

TEST(HtmlDocument, ScriptsAreNotIndexed) {
  auto doc = vd::HtmlDocument::parse(kPage);
  ASSERT_TRUE(doc.has_value());
  for (const auto& el : doc->elements()) {
    EXPECT_NE(el.tag, "script");
    EXPECT_EQ(el.text.find("not text"), std::string::npos);
  }
}

TEST(HtmlDocument, MissingViewportMeta) {
  auto doc = vd::HtmlDocument::parse("<html><body><p>hi</p></body></html>");
  ASSERT_TRUE(doc.has_value());
  EXPECT_FALSE(doc->meta_viewport().has_value());
  EXPECT_NE(doc->find("p:nth-of-type(1)"), nullptr);
}

TEST(StringHelpers, LowerAndTrim) {
  EXPECT_EQ(vd::to_lower("DiV"), "div");
  EXPECT_EQ(vd::trim("  a b \n"), "a b");
  EXPECT_EQ(vd::trim("   "), "");
}
