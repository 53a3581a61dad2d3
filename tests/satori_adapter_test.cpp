#include <gtest/gtest.h>

#include "common/logger.hpp"
#include "core/satori_adapter.hpp"
#include "test_fakes.hpp"

namespace tgsatori::test {

using core::ApiError;
using core::MethodNotFoundError;
using core::SatoriAdapter;
using json = nlohmann::json;

class SatoriAdapterTest : public testing::Test {
protected:
  void SetUp() override {
    common::Logger::initialize(spdlog::level::trace);
    adapter_.set_event_callback(
        [this](const satori::Event &event) { events_.push_back(event); });
  }

  void start() { run(adapter_.start()); }

  void handle(const json &update) { run(adapter_.handle_update(update)); }

  auto call(const std::string &method, json params = json::object()) -> json {
    return run(adapter_.call(method, std::move(params)));
  }

  static auto group_message(int64_t id, const std::string &text) -> json {
    return {{"message_id", id},
            {"date", 1700000000},
            {"chat", {{"id", -1001}, {"type", "supergroup"}, {"title", "Lab"}}},
            {"from", {{"id", 7}, {"first_name", "Bob"}, {"username", "bob"}}},
            {"text", text}};
  }

  FakeBotApi api_;
  FakeFileFetcher fetcher_;
  common::AdapterConfig config_;
  SatoriAdapter adapter_{api_, fetcher_, config_};
  std::vector<satori::Event> events_;
};

TEST_F(SatoriAdapterTest, StartGoesOnline) {
  start();
  EXPECT_EQ(adapter_.self_id(), "42");

  const auto &login = adapter_.login();
  EXPECT_EQ(login.status, satori::LoginStatus::online);
  EXPECT_EQ(login.platform, "telegram");
  EXPECT_EQ(login.adapter, "tgsatori");
  ASSERT_TRUE(login.user.has_value());
  EXPECT_EQ(login.user->id, "42");
  EXPECT_EQ(login.user->name, "satori_bot");
  EXPECT_EQ(login.user->is_bot, true);

  ASSERT_EQ(events_.size(), 1);
  EXPECT_EQ(events_[0].type, "login-updated");
  EXPECT_EQ(events_[0].login.status, satori::LoginStatus::online);
}

TEST_F(SatoriAdapterTest, MessageBecomesMessageCreated) {
  start();
  handle({{"update_id", 1}, {"message", group_message(5, "hi bob")}});

  ASSERT_EQ(events_.size(), 2);
  const auto &event = events_[1];
  EXPECT_EQ(event.type, "message-created");
  EXPECT_GT(event.sn, events_[0].sn);
  EXPECT_EQ(event.timestamp, 1700000000000);

  ASSERT_TRUE(event.channel.has_value());
  EXPECT_EQ(event.channel->id, "-1001");
  EXPECT_EQ(event.channel->type, satori::ChannelType::text);
  ASSERT_TRUE(event.guild.has_value());
  EXPECT_EQ(event.guild->id, "-1001");
  EXPECT_EQ(event.guild->name, "Lab");
  ASSERT_TRUE(event.user.has_value());
  EXPECT_EQ(event.user->id, "7");
  EXPECT_EQ(event.user->nick, "Bob");
  ASSERT_TRUE(event.message.has_value());
  EXPECT_EQ(event.message->id, "5");
  EXPECT_EQ(event.message->content(), "hi bob");

  auto serialized = event.to_json();
  EXPECT_EQ(serialized["message"]["content"], "hi bob");
  EXPECT_EQ(serialized["login"]["user"]["id"], "42");
}

TEST_F(SatoriAdapterTest, EditsBecomeMessageUpdated) {
  start();
  auto edited = group_message(5, "fixed");
  edited["edit_date"] = 1700000100;
  handle({{"update_id", 2}, {"edited_message", edited}});
  handle({{"update_id", 3}, {"edited_channel_post", group_message(6, "post")}});

  ASSERT_EQ(events_.size(), 3);
  EXPECT_EQ(events_[1].type, "message-updated");
  EXPECT_EQ(events_[1].timestamp, 1700000100000);
  EXPECT_EQ(events_[1].message->content(), "fixed");
  EXPECT_EQ(events_[2].type, "message-updated");
}

TEST_F(SatoriAdapterTest, ChannelPostBecomesMessageCreated) {
  start();
  handle({{"update_id", 4}, {"channel_post", group_message(8, "news")}});
  ASSERT_EQ(events_.size(), 2);
  EXPECT_EQ(events_[1].type, "message-created");
}

TEST_F(SatoriAdapterTest, PrivateChatIsDirectChannel) {
  start();
  auto message = group_message(9, "dm");
  message["chat"] = {{"id", 7}, {"type", "private"}, {"first_name", "Bob"}};
  handle({{"update_id", 5}, {"message", message}});

  ASSERT_EQ(events_.size(), 2);
  const auto &event = events_[1];
  EXPECT_FALSE(event.guild.has_value());
  ASSERT_TRUE(event.channel.has_value());
  EXPECT_EQ(event.channel->id, "7");
  EXPECT_EQ(event.channel->type, satori::ChannelType::direct);
}

TEST_F(SatoriAdapterTest, TopicMessageUsesThreadChannel) {
  start();
  auto message = group_message(10, "in topic");
  message["message_thread_id"] = 5;
  message["is_topic_message"] = true;
  handle({{"update_id", 6}, {"message", message}});

  // 非话题消息的 message_thread_id 不计入频道
  auto reply = group_message(11, "reply");
  reply["message_thread_id"] = 3;
  handle({{"update_id", 7}, {"message", reply}});

  ASSERT_EQ(events_.size(), 3);
  EXPECT_EQ(events_[1].channel->id, "-1001:5");
  EXPECT_EQ(events_[2].channel->id, "-1001");
}

TEST_F(SatoriAdapterTest, CallbackQueryBecomesButtonInteraction) {
  start();
  handle({{"update_id", 8},
          {"callback_query",
           {{"id", "cbq-1"},
            {"from", {{"id", 7}, {"first_name", "Bob"}}},
            {"message", group_message(12, "pick one")},
            {"data", "choice-a"}}}});

  ASSERT_EQ(events_.size(), 2);
  const auto &event = events_[1];
  EXPECT_EQ(event.type, "interaction/button");
  ASSERT_TRUE(event.button.has_value());
  EXPECT_EQ(event.button->id, "choice-a");
  EXPECT_EQ(event.user->id, "7");
  EXPECT_EQ(event.channel->id, "-1001");
  ASSERT_TRUE(event.message.has_value());
  EXPECT_EQ(event.message->id, "12");
  EXPECT_EQ(event.message->content(), "pick one");

  ASSERT_EQ(api_.answered_callbacks.size(), 1);
  EXPECT_EQ(api_.answered_callbacks[0], "cbq-1");
}

TEST_F(SatoriAdapterTest, UnsupportedUpdatesAreIgnored) {
  start();
  handle({{"update_id", 9}, {"poll", {{"id", "p"}}}});
  handle(json::array());
  EXPECT_EQ(events_.size(), 1);
}

TEST_F(SatoriAdapterTest, LoginGet) {
  start();
  auto login = call("login.get");
  EXPECT_EQ(login["status"], 1);
  EXPECT_EQ(login["platform"], "telegram");
  EXPECT_EQ(login["user"]["id"], "42");
}

TEST_F(SatoriAdapterTest, UserGet) {
  start();
  auto user = call("user.get", {{"user_id", "7"}});
  EXPECT_EQ(user["id"], "7");
  EXPECT_EQ(user["name"], "alice");
  EXPECT_EQ(user["nick"], "Alice Liddell");
  EXPECT_EQ(user["avatar"], "internal:telegram/42/avatar-file");

  // 数字形式的 id 同样接受
  EXPECT_EQ(call("user.get", {{"user_id", 7}})["id"], "7");
}

TEST_F(SatoriAdapterTest, MessageCreateSendsAndReturnsMessages) {
  start();
  auto result = call("message.create",
                     {{"channel_id", "-1001:4"}, {"content", "<b>hello</b>"}});

  ASSERT_TRUE(result.is_array());
  ASSERT_EQ(result.size(), 1);
  EXPECT_EQ(result[0]["id"], "100");

  ASSERT_EQ(api_.calls.size(), 1);
  EXPECT_EQ(api_.calls[0].method, "send_message");
  EXPECT_EQ(api_.calls[0].target.chat_id, -1001);
  EXPECT_EQ(api_.calls[0].target.thread_id, 4);
  EXPECT_EQ(api_.calls[0].text, "<b>hello</b>");
}

TEST_F(SatoriAdapterTest, MessageCreateUsesConfiguredFetchTimeout) {
  common::AdapterConfig config;
  config.fetch_timeout_s = 12;
  SatoriAdapter adapter(api_, fetcher_, config);
  run(adapter.start());
  fetcher_.add("https://example.com/a.png", "a.png", "image/png");

  run(adapter.call("message.create",
                   {{"channel_id", "-1001"},
                    {"content", "<img src=\"https://example.com/a.png\"/>"}}));
  ASSERT_EQ(fetcher_.fetches.size(), 1);
  EXPECT_EQ(fetcher_.fetches[0].timeout_s, 12);
}

TEST_F(SatoriAdapterTest, MessageUpdateEditsMessage) {
  start();
  auto result = call("message.update", {{"channel_id", "-1001"},
                                        {"message_id", "55"},
                                        {"content", "edited"}});
  EXPECT_TRUE(result.is_object());
  EXPECT_TRUE(result.empty());

  ASSERT_EQ(api_.calls.size(), 1);
  EXPECT_EQ(api_.calls[0].method, "edit_message_text");
  EXPECT_EQ(api_.calls[0].message_id, 55);
  EXPECT_EQ(api_.calls[0].text, "edited");
}

TEST_F(SatoriAdapterTest, InvalidCallsThrowApiError) {
  start();
  EXPECT_THROW(call("guild.list"), MethodNotFoundError);
  EXPECT_THROW(call("user.get"), ApiError);
  EXPECT_THROW(call("user.get", {{"user_id", "abc"}}), ApiError);
  EXPECT_THROW(call("message.create", {{"content", "x"}}), ApiError);
  EXPECT_THROW(call("message.create", {{"channel_id", "-1001"}}), ApiError);
  EXPECT_THROW(
      call("message.create", {{"channel_id", "chat:x"}, {"content", "x"}}),
      ApiError);
  EXPECT_THROW(call("message.update",
                    {{"channel_id", "-1001"}, {"content", "x"}}),
               ApiError);
  EXPECT_TRUE(api_.calls.empty());
}

TEST_F(SatoriAdapterTest, EnsureMatchesPlatformAndAccount) {
  // 上线前没有可匹配的账号
  EXPECT_FALSE(adapter_.ensure("telegram", ""));
  start();
  EXPECT_TRUE(adapter_.ensure("telegram", "42"));
  EXPECT_FALSE(adapter_.ensure("telegram", "43"));
  EXPECT_FALSE(adapter_.ensure("discord", "42"));
}

TEST_F(SatoriAdapterTest, FetchInternalChecksPlatformAndAccount) {
  start();
  api_.files["file-1"] = "DATA";

  auto data = run(adapter_.fetch_internal("telegram/42/file-1"));
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ(*data, "DATA");

  EXPECT_FALSE(run(adapter_.fetch_internal("telegram/43/file-1")).has_value());
  EXPECT_FALSE(run(adapter_.fetch_internal("discord/42/file-1")).has_value());
  EXPECT_FALSE(run(adapter_.fetch_internal("garbage")).has_value());
}

} // namespace tgsatori::test
