#include "trending/html/document.hpp"

#include <gtest/gtest.h>

using trending::html::Document;
using trending::html::Selector;

TEST(DocumentTest, ClassMatchesWholeTokensOnly) {
  auto Doc = Document::parse(
      R"(<div><h2 class="h3 lh-condensed">a</h2><h2 class="h33">b</h2></div>)"
  );
  auto Headings = Doc.root().findAll({.Tag = GUMBO_TAG_H2, .Class = "h3"});
  ASSERT_EQ(Headings.size(), 1u);
  EXPECT_EQ(Headings[0].strippedText(), "a");
}

TEST(DocumentTest, FindAllReturnsDocumentOrderIncludingNested) {
  auto Doc = Document::parse(
      "<p><span>one<span>two</span></span><span>three</span></p>"
  );
  auto Spans = Doc.root().findAll({.Tag = GUMBO_TAG_SPAN});
  ASSERT_EQ(Spans.size(), 3u);
  EXPECT_EQ(Spans[0].strippedText(), "onetwo");
  EXPECT_EQ(Spans[1].strippedText(), "two");
  EXPECT_EQ(Spans[2].strippedText(), "three");
}

TEST(DocumentTest, TextKeepsWhitespaceStrippedTextDropsIt) {
  auto Doc = Document::parse("<a href=\"/x\">\n  owner /\n  <b>repo</b>\n</a>");
  auto Link = Doc.root().findFirst({.Tag = GUMBO_TAG_A});
  ASSERT_TRUE(Link.has_value());
  EXPECT_EQ(Link->strippedText(), "owner /repo");
  EXPECT_NE(Link->text().find('\n'), std::string::npos);
}

TEST(DocumentTest, AttributeAndHrefSuffixSelectors) {
  auto Doc = Document::parse(
      R"(<a href="/o/r/stargazers">1</a><a href="/o/r/forks">2</a>)"
      R"(<span itemprop="programmingLanguage">Go</span>)"
  );
  auto Root = Doc.root();
  EXPECT_EQ(Root.findFirst({.Tag = GUMBO_TAG_A, .HrefSuffix = "/forks"})
                ->strippedText(),
            "2");
  auto Lang = Root.findFirst(
      {.AttributeName = "itemprop", .AttributeValue = "programmingLanguage"}
  );
  ASSERT_TRUE(Lang.has_value());
  EXPECT_EQ(Lang->tag(), GUMBO_TAG_SPAN);
  EXPECT_FALSE(Root.findFirst({.Tag = GUMBO_TAG_A, .HrefSuffix = "/issues"}));
}

TEST(DocumentTest, MalformedMarkupStillParses) {
  auto Doc = Document::parse("<article class=\"Box-row\"><h2 class=\"h3\"><a href=\"/a/b\">a/b");
  auto Articles =
      Doc.root().findAll({.Tag = GUMBO_TAG_ARTICLE, .Class = "Box-row"});
  EXPECT_EQ(Articles.size(), 1u);
}

TEST(DocumentTest, MovedDocumentKeepsTree) {
  auto Doc = Document::parse("<p class=\"x\">hi</p>");
  Document Moved = std::move(Doc);
  auto Para = Moved.root().findFirst({.Tag = GUMBO_TAG_P, .Class = "x"});
  ASSERT_TRUE(Para.has_value());
  EXPECT_EQ(Para->strippedText(), "hi");
}
