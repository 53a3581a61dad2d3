#include <gtest/gtest.h>

#include "common/logger.hpp"
#include "satori/markup.hpp"
#include "telegram/adapter/message_decoder.hpp"

namespace tgsatori::test {

namespace tg = tgsatori::telegram;
using adapter::telegram::parse_text;
using adapter::telegram::Utf16Index;

namespace {
auto entity(std::string type, int64_t offset, int64_t length)
    -> tg::MessageEntity {
  tg::MessageEntity result;
  result.type = std::move(type);
  result.offset = offset;
  result.length = length;
  return result;
}

auto sweep(std::string_view text, const std::vector<tg::MessageEntity> &entities)
    -> std::string {
  return satori::dumps(parse_text(text, entities));
}
} // namespace

class EntitySweepTest : public testing::Test {
protected:
  void SetUp() override { common::Logger::initialize(spdlog::level::trace); }
};

TEST_F(EntitySweepTest, TextWithoutEntitiesPassesThrough) {
  auto elements = parse_text("hello world", {});
  ASSERT_EQ(elements.size(), 1);
  EXPECT_TRUE(elements[0].is_text());
  EXPECT_EQ(elements[0].attr("text"), "hello world");
}

TEST_F(EntitySweepTest, EmptyTextProducesNothing) {
  EXPECT_TRUE(parse_text("", {}).empty());
}

TEST_F(EntitySweepTest, WholeTextBold) {
  auto elements = parse_text("hello", {entity("bold", 0, 5)});
  ASSERT_EQ(elements.size(), 1);
  EXPECT_EQ(elements[0].kind, satori::ElementKind::bold);
  EXPECT_EQ(satori::dumps(elements), "<b>hello</b>");
}

TEST_F(EntitySweepTest, BoldAndItalicOverSameRangeFormOneRun) {
  auto elements =
      parse_text("hello", {entity("bold", 0, 5), entity("italic", 0, 5)});
  ASSERT_EQ(elements.size(), 1);
  EXPECT_EQ(satori::dumps(elements), "<i><b>hello</b></i>");
}

TEST_F(EntitySweepTest, LineBreakInterruptsBold) {
  auto elements = parse_text("ab\ncd", {entity("bold", 0, 5)});
  ASSERT_EQ(elements.size(), 3);
  EXPECT_EQ(elements[1].kind, satori::ElementKind::line_break);
  EXPECT_EQ(satori::dumps(elements), "<b>ab</b><br/><b>cd</b>");
}

TEST_F(EntitySweepTest, TrailingLineBreak) {
  EXPECT_EQ(sweep("ab\n", {}), "ab<br/>");
}

TEST_F(EntitySweepTest, OverlappingEntitiesSplitIntoRuns) {
  EXPECT_EQ(sweep("abcd", {entity("bold", 0, 3), entity("italic", 1, 3)}),
            "<b>a</b><i><b>bc</b></i><i>d</i>");
}

TEST_F(EntitySweepTest, WrapOrderIsFixed) {
  EXPECT_EQ(sweep("x", {entity("spoiler", 0, 1), entity("underline", 0, 1),
                        entity("strikethrough", 0, 1), entity("code", 0, 1)}),
            "<spl><code><s><u>x</u></s></code></spl>");
}

TEST_F(EntitySweepTest, OffsetsAreUtf16CodeUnits) {
  // U+1F600 占两个 UTF-16 单元
  const std::string text = "\xF0\x9F\x98\x80hi";
  EXPECT_EQ(sweep(text, {entity("bold", 2, 2)}), "\xF0\x9F\x98\x80<b>hi</b>");
}

TEST_F(EntitySweepTest, Utf16IndexMapsOntoCodePointBoundaries) {
  // "a" + U+1F600 + "b"
  Utf16Index index("a\xF0\x9F\x98\x80"
                   "b");
  EXPECT_EQ(index.to_byte(0), 0);
  EXPECT_EQ(index.to_byte(1), 1);
  EXPECT_EQ(index.to_byte(2), 5);
  EXPECT_EQ(index.to_byte(3), 5);
  EXPECT_EQ(index.to_byte(4), 6);
  EXPECT_EQ(index.to_byte(100), 6);
  EXPECT_EQ(index.to_byte(-3), 0);
}

TEST_F(EntitySweepTest, MultiByteTextWithoutSurrogates) {
  // 每个汉字是一个 UTF-16 单元、三个 UTF-8 字节
  EXPECT_EQ(sweep("你好世界", {entity("italic", 2, 2)}),
            "你好<i>世界</i>");
}

TEST_F(EntitySweepTest, MentionBecomesAtElement) {
  auto elements = parse_text("hi @bob", {entity("mention", 3, 4)});
  ASSERT_EQ(elements.size(), 2);
  EXPECT_EQ(elements[1].kind, satori::ElementKind::mention);
  EXPECT_EQ(elements[1].attr("name"), "bob");
  EXPECT_EQ(elements[1].text_content(), "@bob");
  EXPECT_EQ(satori::dumps(elements), "hi <at name=\"bob\">@bob</at>");
}

TEST_F(EntitySweepTest, MentionDiscardsInnerFormatting) {
  EXPECT_EQ(sweep("@bob", {entity("bold", 0, 4), entity("mention", 0, 4)}),
            "<at name=\"bob\">@bob</at>");
}

TEST_F(EntitySweepTest, TextLinkCarriesHref) {
  auto link = entity("text_link", 4, 4);
  link.url = "https://example.com";
  EXPECT_EQ(sweep("see docs", {link}),
            "see <a href=\"https://example.com\">docs</a>");
}

TEST_F(EntitySweepTest, LinkWrapsFormatting) {
  auto link = entity("text_link", 0, 4);
  link.url = "u";
  EXPECT_EQ(sweep("docs", {link, entity("bold", 0, 4)}),
            "<a href=\"u\"><b>docs</b></a>");
}

TEST_F(EntitySweepTest, SpanEndClearsStateUnconditionally) {
  // 后一个链接先列出，前一个链接在同一位置结束时清除它
  auto first = entity("text_link", 0, 3);
  first.url = "a";
  auto second = entity("text_link", 3, 3);
  second.url = "b";
  EXPECT_EQ(sweep("abcdef", {second, first}), "<a href=\"a\">abc</a>def");

  // 按文本顺序列出时两段链接都保留
  EXPECT_EQ(sweep("abcdef", {first, second}),
            "<a href=\"a\">abc</a><a href=\"b\">def</a>");
}

TEST_F(EntitySweepTest, TextMentionReferencesUser) {
  auto mention = entity("text_mention", 4, 5);
  tg::User user;
  user.id = 7;
  user.first_name = "Alice";
  user.username = "alice";
  mention.user = user;
  EXPECT_EQ(sweep("hey Alice", {mention}),
            "hey <at id=\"7\" name=\"alice\">Alice</at>");
}

TEST_F(EntitySweepTest, UnrecognizedEntitiesAreIgnored) {
  auto elements = parse_text("#tag", {entity("hashtag", 0, 4)});
  ASSERT_EQ(elements.size(), 1);
  EXPECT_TRUE(elements[0].is_text());
}

TEST_F(EntitySweepTest, ZeroLengthSpanHasNoEffect) {
  auto elements = parse_text("abc", {entity("bold", 1, 0)});
  std::string text;
  for (const auto &element : elements) {
    EXPECT_TRUE(element.is_text());
    text += element.text_content();
  }
  EXPECT_EQ(text, "abc");
}

TEST_F(EntitySweepTest, SpanPastEndIsClamped) {
  EXPECT_EQ(sweep("abc", {entity("bold", 1, 100)}), "a<b>bc</b>");
}

TEST_F(EntitySweepTest, TextContentIsPreserved) {
  const std::string text = "line one\nline two with @mention and link";
  auto link = entity("text_link", 36, 4);
  link.url = "https://example.com";
  auto elements = parse_text(
      text, {entity("bold", 0, 14), entity("mention", 23, 8), link});
  std::string flattened;
  for (const auto &element : elements) {
    flattened += element.kind == satori::ElementKind::line_break
                     ? "\n"
                     : element.text_content();
  }
  EXPECT_EQ(flattened, text);
}

} // namespace tgsatori::test
