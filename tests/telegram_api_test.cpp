#include <gtest/gtest.h>

#include "common/logger.hpp"
#include "telegram/network/connection_manager.hpp"
#include "test_fakes.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <algorithm>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace tgsatori::test {

using network::HttpResponse;
using network::InlineButton;
using network::InputMedia;
using network::TelegramApiError;
using network::TelegramConnectionManager;
using nlohmann::json;

constexpr auto kRequestTimeout = std::chrono::seconds(5);
constexpr auto kIdleResponseDelay = std::chrono::milliseconds(20);

/**
 * 模拟 Bot API 服务器：按顺序返回预设的响应，记录收到的请求
 * (自包含，管理自己的线程和io_context)
 */
class MockBotApiServer {
public:
  struct Request {
    std::string target;
    std::string content_type;
    std::string body;
  };

  MockBotApiServer()
      : acceptor_(ioc_,
                  tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

  ~MockBotApiServer() { stop(); }

  void start() {
    do_accept();
    thread_ = std::thread([this]() {
      TGSATORI_DEBUG("模拟服务器线程启动于端口 {}", port());
      ioc_.run();
      TGSATORI_DEBUG("模拟服务器线程停止");
    });
  }

  void stop() {
    ioc_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void respond(std::string body, http::status status = http::status::ok) {
    std::lock_guard lock(mutex_);
    responses_.push_back({status, std::move(body)});
  }

  auto requests() -> std::vector<Request> {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  auto port() const -> uint16_t { return acceptor_.local_endpoint().port(); }

private:
  struct Response {
    http::status status;
    std::string body;
  };

  void do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (!acceptor_.is_open()) {
        return;
      }
      if (!ec) {
        handle(std::move(socket));
      }
      do_accept();
    });
  }

  // 测试中的请求是串行的，直接同步处理
  void handle(tcp::socket socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    beast::error_code ec;
    http::read(socket, buffer, request, ec);
    if (ec) {
      return;
    }

    std::optional<Response> response;
    {
      std::lock_guard lock(mutex_);
      requests_.push_back(
          {std::string(request.target()),
           std::string(request[http::field::content_type]), request.body()});
      if (!responses_.empty()) {
        response = std::move(responses_.front());
        responses_.pop_front();
      }
    }
    if (!response) {
      // 空闲时模拟一次没有更新的长轮询
      std::this_thread::sleep_for(kIdleResponseDelay);
      response = Response{http::status::ok, R"({"ok":true,"result":[]})"};
    }

    http::response<http::string_body> reply{response->status,
                                            request.version()};
    reply.set(http::field::content_type, "application/json");
    reply.keep_alive(false);
    reply.body() = std::move(response->body);
    reply.prepare_payload();
    http::write(socket, reply, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  asio::io_context ioc_;
  tcp::acceptor acceptor_;
  std::thread thread_;

  std::mutex mutex_;
  std::deque<Response> responses_;
  std::vector<Request> requests_;
};

class TelegramApiTest : public testing::Test {
protected:
  void SetUp() override {
    common::Logger::initialize(spdlog::level::trace);
    server_.start();

    common::AdapterConfig config;
    config.telegram.host = "127.0.0.1";
    config.telegram.port = server_.port();
    config.telegram.use_ssl = false;
    config.telegram.access_token = "test-token";
    config.telegram.timeout = kRequestTimeout;
    config.poll_timeout = std::chrono::seconds(1);
    config.poll_interval = std::chrono::milliseconds(50);

    manager_ = std::make_unique<TelegramConnectionManager>(ioc_, config);
    manager_->connect();
  }

  void TearDown() override {
    manager_.reset();
    server_.stop();
  }

  static auto message_json(int64_t id) -> std::string {
    return json{{"message_id", id},
                {"date", 1700000000},
                {"chat", {{"id", -1001}, {"type", "supergroup"}}}}
        .dump();
  }

  static auto ok(const std::string &result) -> std::string {
    return R"({"ok":true,"result":)" + result + "}";
  }

  // 服务器先于连接管理器析构
  MockBotApiServer server_;
  asio::io_context ioc_;
  std::unique_ptr<TelegramConnectionManager> manager_;
};

TEST_F(TelegramApiTest, GetMeParsesResult) {
  server_.respond(ok(
      R"({"id":42,"is_bot":true,"first_name":"Satori","username":"satori_bot"})"));
  auto me = run(manager_->get_me());
  EXPECT_EQ(me.id, 42);
  EXPECT_TRUE(me.is_bot);
  EXPECT_EQ(me.username, "satori_bot");

  auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].target, "/bottest-token/getMe");
  EXPECT_EQ(requests[0].content_type, "application/json");
}

TEST_F(TelegramApiTest, SendMessageRequestBody) {
  server_.respond(ok(message_json(100)));
  network::InlineKeyboard keyboard = {
      {InlineButton{"Go", InlineButton::Action::callback, "go"}}, {}};
  auto message = run(manager_->send_message(tg::ChatTarget{-1001, 7},
                                            "<b>hi</b>", 5, keyboard));
  EXPECT_EQ(message.message_id, 100);

  auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].target, "/bottest-token/sendMessage");
  auto body = json::parse(requests[0].body);
  EXPECT_EQ(body["chat_id"], -1001);
  EXPECT_EQ(body["message_thread_id"], 7);
  EXPECT_EQ(body["text"], "<b>hi</b>");
  EXPECT_EQ(body["parse_mode"], "HTML");
  EXPECT_EQ(body["reply_parameters"]["message_id"], 5);
  ASSERT_EQ(body["reply_markup"]["inline_keyboard"].size(), 1);
  EXPECT_EQ(body["reply_markup"]["inline_keyboard"][0][0]["callback_data"],
            "go");
}

TEST_F(TelegramApiTest, ApiErrorIsThrown) {
  server_.respond(
      R"({"ok":false,"error_code":400,"description":"Bad Request: chat not found"})",
      http::status::bad_request);
  try {
    run(manager_->send_message(tg::ChatTarget{1, std::nullopt}, "x",
                               std::nullopt, {}));
    FAIL() << "expected TelegramApiError";
  } catch (const TelegramApiError &e) {
    EXPECT_EQ(e.error_code(), 400);
    EXPECT_EQ(e.description(), "Bad Request: chat not found");
  }
}

TEST_F(TelegramApiTest, MediaGroupIsMultipart) {
  server_.respond(
      ok("[" + message_json(100) + "," + message_json(101) + "]"));
  std::vector<InputMedia> media(2);
  media[0].kind = InputMedia::Kind::photo;
  media[0].filename = "0a.png";
  media[0].data = "PNGDATA";
  media[0].mime = "image/png";
  media[0].caption = "<i>cap</i>";
  media[1].kind = InputMedia::Kind::video;
  media[1].filename = "1b.mp4";
  media[1].data = "MP4DATA";
  media[1].mime = "video/mp4";
  media[1].has_spoiler = true;

  auto messages = run(manager_->send_media_group(tg::ChatTarget{-1001, std::nullopt},
                                                 std::move(media), 9));
  ASSERT_EQ(messages.size(), 2);
  EXPECT_EQ(messages[1].message_id, 101);

  auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].target, "/bottest-token/sendMediaGroup");
  EXPECT_EQ(requests[0].content_type.rfind("multipart/form-data; boundary=", 0),
            0);
  const auto &body = requests[0].body;
  EXPECT_NE(body.find("filename=\"0a.png\""), std::string::npos);
  EXPECT_NE(body.find("PNGDATA"), std::string::npos);
  EXPECT_NE(body.find("attach://file1"), std::string::npos);
  EXPECT_NE(body.find("\"has_spoiler\":true"), std::string::npos);
  EXPECT_NE(body.find("name=\"reply_parameters\""), std::string::npos);
}

TEST_F(TelegramApiTest, SingleMediaUsesDedicatedMethod) {
  server_.respond(ok(message_json(100)));
  std::vector<InputMedia> media(1);
  media[0].kind = InputMedia::Kind::photo;
  media[0].filename = "0a.png";
  media[0].data = "PNGDATA";
  media[0].mime = "image/png";
  media[0].caption = "cap";

  auto messages = run(manager_->send_media_group(
      tg::ChatTarget{-1001, std::nullopt}, std::move(media), std::nullopt));
  ASSERT_EQ(messages.size(), 1);

  auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].target, "/bottest-token/sendPhoto");
  EXPECT_NE(requests[0].body.find("name=\"photo\"; filename=\"0a.png\""),
            std::string::npos);
  EXPECT_NE(requests[0].body.find("name=\"caption\""), std::string::npos);
}

TEST_F(TelegramApiTest, AnimationUsesSendAnimation) {
  server_.respond(ok(message_json(100)));
  InputMedia animation;
  animation.kind = InputMedia::Kind::animation;
  animation.filename = "0c.gif";
  animation.data = "GIF89a";
  animation.mime = "image/gif";
  run(manager_->send_animation(tg::ChatTarget{-1001, std::nullopt},
                               std::move(animation), 100));

  auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].target, "/bottest-token/sendAnimation");
  EXPECT_NE(requests[0].body.find("name=\"animation\"; filename=\"0c.gif\""),
            std::string::npos);
}

TEST_F(TelegramApiTest, GetFileContentDownloadsFile) {
  server_.respond(ok(R"({"file_id":"abc","file_path":"photos/a.jpg"})"));
  server_.respond("JPEGDATA");
  auto data = run(manager_->get_file_content("abc"));
  EXPECT_EQ(data, "JPEGDATA");

  auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_EQ(requests[0].target, "/bottest-token/getFile");
  EXPECT_EQ(requests[1].target, "/file/bottest-token/photos/a.jpg");
}

TEST_F(TelegramApiTest, PollingDeliversUpdatesAndAdvancesOffset) {
  server_.respond(ok(R"([{"update_id":5,"message":{"message_id":1,"date":1,)"
                     R"("chat":{"id":7,"type":"private"},"text":"hi"}}])"));

  std::promise<json> received;
  manager_->set_update_callback(
      [&received](const json &update) { received.set_value(update); });
  manager_->start_polling();

  auto future = received.get_future();
  // 更新被投递到 ioc_，需要运行它
  const auto deadline = std::chrono::steady_clock::now() + kRequestTimeout;
  while (future.wait_for(std::chrono::milliseconds(0)) !=
             std::future_status::ready &&
         std::chrono::steady_clock::now() < deadline) {
    ioc_.run_for(std::chrono::milliseconds(20));
    ioc_.restart();
  }
  ASSERT_EQ(future.wait_for(std::chrono::milliseconds(0)),
            std::future_status::ready);
  EXPECT_EQ(future.get()["update_id"], 5);

  while (server_.requests().size() < 2 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  manager_->stop_polling();

  auto requests = server_.requests();
  ASSERT_GE(requests.size(), 2);
  EXPECT_EQ(requests[0].target, "/bottest-token/getUpdates");
  EXPECT_EQ(json::parse(requests[0].body)["offset"], 0);
  EXPECT_EQ(json::parse(requests[1].body)["offset"], 6);

  // 订阅的更新类型需覆盖适配器处理的全部类型
  const auto allowed = json::parse(requests[0].body)["allowed_updates"];
  for (const auto *type : {"message", "edited_message", "channel_post",
                           "edited_channel_post", "callback_query"}) {
    EXPECT_NE(std::find(allowed.begin(), allowed.end(), type), allowed.end())
        << type;
  }
}

TEST_F(TelegramApiTest, ParseApiResponse) {
  HttpResponse response;
  response.status_code = 200;
  response.body = R"({"ok":true,"result":{"x":1}})";
  EXPECT_EQ(TelegramConnectionManager::parse_api_response(response)["x"], 1);

  response.body = "<html>bad gateway</html>";
  response.status_code = 502;
  EXPECT_THROW(TelegramConnectionManager::parse_api_response(response),
               network::HttpClientError);

  response.body = R"({"ok":false})";
  try {
    TelegramConnectionManager::parse_api_response(response);
    FAIL() << "expected TelegramApiError";
  } catch (const TelegramApiError &e) {
    EXPECT_EQ(e.error_code(), 502);
    EXPECT_EQ(e.description(), "unknown");
  }
}

TEST_F(TelegramApiTest, BuildMultipart) {
  const auto body = TelegramConnectionManager::build_multipart(
      "XYZ", {{"chat_id", "1"}}, {{"photo", "a.png", "image/png", "DATA"}});
  EXPECT_EQ(body, "--XYZ\r\n"
                  "Content-Disposition: form-data; name=\"chat_id\"\r\n\r\n"
                  "1\r\n"
                  "--XYZ\r\n"
                  "Content-Disposition: form-data; name=\"photo\"; "
                  "filename=\"a.png\"\r\n"
                  "Content-Type: image/png\r\n\r\n"
                  "DATA\r\n"
                  "--XYZ--\r\n");
}

TEST_F(TelegramApiTest, KeyboardToJsonSkipsEmptyRows) {
  network::InlineKeyboard keyboard = {
      {},
      {InlineButton{"Open", InlineButton::Action::url, "https://example.com"},
       InlineButton{"Ask", InlineButton::Action::query, "/q"}},
      {}};
  auto j = TelegramConnectionManager::keyboard_to_json(keyboard);
  ASSERT_EQ(j["inline_keyboard"].size(), 1);
  EXPECT_EQ(j["inline_keyboard"][0][0]["url"], "https://example.com");
  EXPECT_EQ(j["inline_keyboard"][0][1]["switch_inline_query_current_chat"],
            "/q");
}

TEST_F(TelegramApiTest, MediaGroupPayload) {
  std::vector<InputMedia> media(2);
  media[0].kind = InputMedia::Kind::photo;
  media[0].filename = "0a.png";
  media[0].data = "A";
  media[0].caption = "cap";
  media[1].kind = InputMedia::Kind::document;
  media[1].filename = "1b.pdf";
  media[1].data = "B";

  auto [items, files] = TelegramConnectionManager::media_group_payload(media);
  ASSERT_EQ(items.size(), 2);
  EXPECT_EQ(items[0]["type"], "photo");
  EXPECT_EQ(items[0]["media"], "attach://file0");
  EXPECT_EQ(items[0]["caption"], "cap");
  EXPECT_EQ(items[0]["parse_mode"], "HTML");
  EXPECT_EQ(items[1]["type"], "document");
  EXPECT_FALSE(items[1].contains("caption"));
  ASSERT_EQ(files.size(), 2);
  EXPECT_EQ(files[1].field, "file1");
  EXPECT_EQ(files[1].filename, "1b.pdf");
  EXPECT_EQ(files[1].data, "B");
}

} // namespace tgsatori::test
