#include <gtest/gtest.h>

#include "common/logger.hpp"
#include "satori/markup.hpp"
#include "telegram/adapter/locator.hpp"
#include "telegram/adapter/message_decoder.hpp"
#include "telegram/adapter/user_parser.hpp"

#include <nlohmann/json.hpp>

namespace tgsatori::test {

namespace tg = tgsatori::telegram;
using nlohmann::json;
using namespace adapter::telegram;

constexpr const char *kSelfId = "42";

class MessageDecoderTest : public testing::Test {
protected:
  void SetUp() override { common::Logger::initialize(spdlog::level::trace); }

  static auto decode(const json &raw) -> satori::MessageObject {
    return parse_message(kSelfId, tg::Message::from_json(raw));
  }

  static auto base_message() -> json {
    return {{"message_id", 10},
            {"date", 1700000000},
            {"chat", {{"id", -1001}, {"type", "supergroup"}, {"title", "Dev"}}},
            {"from",
             {{"id", 7},
              {"is_bot", false},
              {"first_name", "Alice"},
              {"last_name", "Liddell"},
              {"username", "alice"}}}};
  }
};

TEST_F(MessageDecoderTest, PlainTextMessage) {
  auto raw = base_message();
  raw["text"] = "hello <world>";
  auto message = decode(raw);
  EXPECT_EQ(message.id, "10");
  EXPECT_EQ(message.created_at, 1700000000LL * 1000);
  EXPECT_EQ(message.content(), "hello &lt;world&gt;");
}

TEST_F(MessageDecoderTest, TextEntitiesAreDecoded) {
  auto raw = base_message();
  raw["text"] = "bold text";
  raw["entities"] = json::array({{{"type", "bold"}, {"offset", 0}, {"length", 4}}});
  EXPECT_EQ(decode(raw).content(), "<b>bold</b> text");
}

TEST_F(MessageDecoderTest, PhotoWithCaption) {
  auto raw = base_message();
  raw["caption"] = "look";
  raw["caption_entities"] =
      json::array({{{"type", "italic"}, {"offset", 0}, {"length", 4}}});
  raw["photo"] = json::array(
      {{{"file_id", "small"}, {"width", 90}, {"height", 90}},
       {{"file_id", "large"}, {"width", 1280}, {"height", 960}},
       {{"file_id", "medium"}, {"width", 320}, {"height", 240}}});
  EXPECT_EQ(decode(raw).content(),
            "<i>look</i> <img src=\"internal:telegram/42/large\"/>");
}

TEST_F(MessageDecoderTest, EmptyCaptionAddsNoSeparator) {
  auto raw = base_message();
  raw["caption"] = "";
  raw["voice"] = {{"file_id", "v1"}, {"file_name", "ignored.ogg"}};
  EXPECT_EQ(decode(raw).content(), "<audio src=\"internal:telegram/42/v1\"/>");
}

TEST_F(MessageDecoderTest, StickerCarriesTitle) {
  auto raw = base_message();
  raw["sticker"] = {{"file_id", "st"}, {"file_name", "sticker.webp"}};
  EXPECT_EQ(decode(raw).content(),
            "<img src=\"internal:telegram/42/st\" title=\"sticker.webp\"/>");
}

TEST_F(MessageDecoderTest, DocumentBecomesFile) {
  auto raw = base_message();
  raw["document"] = {{"file_id", "doc"}, {"file_name", "report.pdf"}};
  EXPECT_EQ(decode(raw).content(),
            "<file src=\"internal:telegram/42/doc\" title=\"report.pdf\"/>");
}

TEST_F(MessageDecoderTest, VideoAndAnimation) {
  auto video = base_message();
  video["video"] = {{"file_id", "vid"}};
  EXPECT_EQ(decode(video).content(),
            "<video src=\"internal:telegram/42/vid\"/>");

  auto animation = base_message();
  animation["animation"] = {{"file_id", "gif"}, {"file_name", "a.mp4"}};
  EXPECT_EQ(decode(animation).content(),
            "<img src=\"internal:telegram/42/gif\" title=\"a.mp4\"/>");
}

TEST_F(MessageDecoderTest, LocationTakesPrecedence) {
  auto raw = base_message();
  raw["location"] = {{"latitude", 1.5}, {"longitude", 2.5}};
  raw["document"] = {{"file_id", "doc"}};
  auto message = decode(raw);
  ASSERT_EQ(message.elements.size(), 1);
  EXPECT_EQ(message.elements[0].tag, "location");
  EXPECT_DOUBLE_EQ(message.elements[0].attrs["lat"].get<double>(), 1.5);
  EXPECT_DOUBLE_EQ(message.elements[0].attrs["lon"].get<double>(), 2.5);
}

TEST_F(MessageDecoderTest, ReplyBecomesQuote) {
  auto reply = base_message();
  reply["message_id"] = 9;
  reply["text"] = "original";

  auto raw = base_message();
  raw["text"] = "answer";
  raw["reply_to_message"] = reply;

  auto message = decode(raw);
  ASSERT_EQ(message.elements.size(), 2);
  const auto &quote = message.elements[0];
  EXPECT_EQ(quote.kind, satori::ElementKind::quote);
  EXPECT_EQ(quote.attr("id"), "9");
  ASSERT_EQ(quote.children.size(), 2);
  EXPECT_EQ(quote.children[0].tag, "user");
  EXPECT_EQ(quote.children[0].attr("id"), "7");
  EXPECT_EQ(quote.children[0].attr("name"), "alice");
  EXPECT_EQ(quote.children[0].attr("nick"), "Alice Liddell");
  EXPECT_EQ(quote.children[1].text_content(), "original");
  EXPECT_EQ(message.elements[1].text_content(), "answer");
}

TEST_F(MessageDecoderTest, TopicCreationReplyIsNotQuoted) {
  auto created = base_message();
  created["message_id"] = 3;
  created["forum_topic_created"] = {{"name", "Topic"}};

  auto raw = base_message();
  raw["text"] = "in topic";
  raw["is_topic_message"] = true;
  raw["message_thread_id"] = 3;
  raw["reply_to_message"] = created;

  EXPECT_EQ(decode(raw).content(), "in topic");
}

TEST_F(MessageDecoderTest, MissingRequiredFieldThrows) {
  json raw = {{"message_id", 1}};
  EXPECT_THROW(tg::Message::from_json(raw), nlohmann::json::exception);
}

TEST_F(MessageDecoderTest, UserParsing) {
  tg::User user;
  user.id = 7;
  user.first_name = "Alice";
  user.username = "alice";
  user.big_photo_file_id = "photo";

  auto parsed = parse_user(kSelfId, user);
  EXPECT_EQ(parsed.id, "7");
  EXPECT_EQ(parsed.name, "alice");
  EXPECT_EQ(parsed.nick, "Alice");
  EXPECT_EQ(parsed.avatar, "internal:telegram/42/photo");
  EXPECT_EQ(parsed.is_bot, false);
}

TEST_F(MessageDecoderTest, PrivateChatIsDirectChannel) {
  tg::Chat chat;
  chat.id = 7;
  chat.type = "private";
  auto [guild, channel] = parse_guild_channel(kSelfId, chat);
  EXPECT_FALSE(guild.has_value());
  EXPECT_EQ(channel.id, "7");
  EXPECT_EQ(channel.type, satori::ChannelType::direct);
}

TEST_F(MessageDecoderTest, TopicChannelIdIncludesThread) {
  tg::Chat chat;
  chat.id = -1001;
  chat.type = "supergroup";
  chat.title = "Dev";
  chat.is_forum = true;
  auto [guild, channel] = parse_guild_channel(kSelfId, chat, 5);
  ASSERT_TRUE(guild.has_value());
  EXPECT_EQ(guild->id, "-1001");
  EXPECT_EQ(guild->name, "Dev");
  EXPECT_EQ(channel.id, "-1001:5");
  EXPECT_EQ(channel.type, satori::ChannelType::text);
}

TEST_F(MessageDecoderTest, ChatTargetParsing) {
  auto plain = tg::ChatTarget::parse("-1001");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->chat_id, -1001);
  EXPECT_FALSE(plain->thread_id.has_value());

  auto topic = tg::ChatTarget::parse("-1001:5");
  ASSERT_TRUE(topic.has_value());
  EXPECT_EQ(topic->thread_id, 5);
  EXPECT_EQ(topic->to_channel_id(), "-1001:5");

  EXPECT_FALSE(tg::ChatTarget::parse("abc").has_value());
  EXPECT_FALSE(tg::ChatTarget::parse("12:x").has_value());
  EXPECT_FALSE(tg::ChatTarget::parse("").has_value());
}

TEST_F(MessageDecoderTest, LocatorRoundTrip) {
  auto locator = make_locator("42", "AgAD-file_id");
  EXPECT_EQ(locator, "internal:telegram/42/AgAD-file_id");

  auto parsed = parse_locator(locator);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->platform, "telegram");
  EXPECT_EQ(parsed->account_id, "42");
  EXPECT_EQ(parsed->file_id, "AgAD-file_id");

  EXPECT_FALSE(parse_locator("https://example.com/a").has_value());
  EXPECT_FALSE(parse_locator("internal:telegram/42").has_value());
  EXPECT_FALSE(parse_locator("internal:telegram//file").has_value());
}

} // namespace tgsatori::test
