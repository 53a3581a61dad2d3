#include "core/satori_server.hpp"
#include "common/json_utils.hpp"
#include "common/logger.hpp"
#include "network/file_fetcher.hpp"
#include "satori/element.hpp"
#include "telegram/adapter/message_encoder.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>

namespace tgsatori::core {

namespace websocket = beast::websocket;
using json = nlohmann::json;

namespace {

constexpr char kServerName[] = "tgsatori";
// 消息内容可能内嵌 data: URI
constexpr uint64_t kRequestBodyLimit = 32ULL * 1024 * 1024;
constexpr auto kIdleTimeout = std::chrono::seconds(60);

// 协程结束时记录异常
void log_failure(const std::exception_ptr &error, const char *what) {
  if (!error) {
    return;
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    TGSATORI_ERROR("{} 失败: {}", what, e.what());
  }
}

auto header_of(const SatoriServer::Request &request, beast::string_view name,
               beast::string_view fallback) -> std::string {
  auto value = request[name];
  if (value.empty()) {
    value = request[fallback];
  }
  return std::string(value.data(), value.size());
}

auto make_response(const SatoriServer::Request &request, http::status status,
                   std::string body, const std::string &content_type)
    -> SatoriServer::Response {
  SatoriServer::Response response{status, request.version()};
  response.set(http::field::server, kServerName);
  response.set(http::field::content_type, content_type);
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

auto text_response(const SatoriServer::Request &request, http::status status,
                   std::string message) -> SatoriServer::Response {
  return make_response(request, status, std::move(message),
                       "text/plain; charset=utf-8");
}

} // namespace

/**
 * @brief 一条事件 WebSocket 连接，写入经由队列串行化
 */
class EventSession : public std::enable_shared_from_this<EventSession> {
public:
  explicit EventSession(beast::tcp_stream stream) : ws(std::move(stream)) {}

  void send(std::string frame) {
    outbox_.push_back(std::move(frame));
    if (writing_) {
      return;
    }
    writing_ = true;
    asio::co_spawn(ws.get_executor(), write_loop(shared_from_this()),
                   [](const std::exception_ptr &error) {
                     log_failure(error, "推送事件");
                   });
  }

  bool writing() const { return writing_; }

  websocket::stream<beast::tcp_stream> ws;
  bool identified = false;

private:
  static auto write_loop(std::shared_ptr<EventSession> self)
      -> asio::awaitable<void> {
    try {
      while (!self->outbox_.empty()) {
        auto frame = std::move(self->outbox_.front());
        self->outbox_.pop_front();
        co_await self->ws.async_write(asio::buffer(frame),
                                      asio::use_awaitable);
      }
    } catch (const beast::system_error &se) {
      TGSATORI_DEBUG("事件连接写入失败: {}", se.what());
      self->outbox_.clear();
    }
    self->writing_ = false;
  }

  std::deque<std::string> outbox_;
  bool writing_ = false;
};

SatoriServer::SatoriServer(asio::io_context &ioc, common::ServerConfig config,
                           SatoriAdapter &adapter)
    : ioc_(ioc), config_(std::move(config)), adapter_(adapter),
      acceptor_(ioc) {}

SatoriServer::~SatoriServer() = default;

void SatoriServer::start() {
  tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(asio::socket_base::max_listen_connections);

  TGSATORI_INFO("Satori 服务已启动: http://{}:{}{}", config_.host, port(),
                config_.path);
  asio::co_spawn(ioc_, accept_loop(), [](const std::exception_ptr &error) {
    log_failure(error, "接受连接");
  });
}

void SatoriServer::stop() {
  beast::error_code ec;
  acceptor_.close(ec);
  for (auto &session : sessions_) {
    beast::get_lowest_layer(session->ws).close();
  }
  sessions_.clear();
}

void SatoriServer::broadcast(const satori::Event &event) {
  auto frame = json{{"op", kOpEvent}, {"body", event.to_json()}}.dump();
  asio::post(ioc_, [this, frame = std::move(frame)]() {
    for (auto &session : sessions_) {
      if (session->identified) {
        session->send(frame);
      }
    }
  });
}

auto SatoriServer::port() const -> uint16_t {
  return acceptor_.local_endpoint().port();
}

auto SatoriServer::accept_loop() -> asio::awaitable<void> {
  while (acceptor_.is_open()) {
    tcp::socket socket(ioc_);
    beast::error_code ec;
    co_await acceptor_.async_accept(
        socket, asio::redirect_error(asio::use_awaitable, ec));
    if (ec == asio::error::operation_aborted) {
      co_return;
    }
    if (ec) {
      TGSATORI_WARN("接受连接失败: {}", ec.message());
      continue;
    }
    asio::co_spawn(ioc_, serve_connection(std::move(socket)),
                   [](const std::exception_ptr &error) {
                     log_failure(error, "处理连接");
                   });
  }
}

auto SatoriServer::serve_connection(tcp::socket socket)
    -> asio::awaitable<void> {
  beast::tcp_stream stream(std::move(socket));
  beast::flat_buffer buffer;

  try {
    for (;;) {
      http::request_parser<http::string_body> parser;
      parser.body_limit(kRequestBodyLimit);
      stream.expires_after(kIdleTimeout);
      co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
      auto request = parser.release();

      if (websocket::is_upgrade(request) &&
          route_of(request) == "/v1/events") {
        stream.expires_never();
        co_await serve_events(std::move(stream), std::move(request));
        co_return;
      }

      auto response = co_await handle_request(request);
      TGSATORI_DEBUG("{} {} -> {}", std::string(request.method_string()),
                     std::string(request.target()), response.result_int());
      stream.expires_after(kIdleTimeout);
      co_await http::async_write(stream, response, asio::use_awaitable);
      if (!response.keep_alive()) {
        break;
      }
    }
  } catch (const beast::system_error &se) {
    if (se.code() != http::error::end_of_stream &&
        se.code() != beast::error::timeout) {
      TGSATORI_DEBUG("HTTP 连接中断: {}", se.what());
    }
  }

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

auto SatoriServer::serve_events(beast::tcp_stream stream, Request request)
    -> asio::awaitable<void> {
  auto session = std::make_shared<EventSession>(std::move(stream));
  session->ws.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  session->ws.set_option(websocket::stream_base::decorator(
      [](websocket::response_type &res) {
        res.set(http::field::server, kServerName);
      }));
  co_await session->ws.async_accept(request, asio::use_awaitable);

  sessions_.push_back(session);
  TGSATORI_INFO("事件连接已建立，当前 {} 个", sessions_.size());

  beast::flat_buffer buffer;
  try {
    for (;;) {
      buffer.clear();
      co_await session->ws.async_read(buffer, asio::use_awaitable);
      auto signal =
          common::JsonUtils::parse(beast::buffers_to_string(buffer.data()));
      if (!signal || !signal->is_object()) {
        TGSATORI_WARN("忽略无效的事件信令");
        continue;
      }

      const auto op = common::JsonUtils::get_value<int>(*signal, "op", -1);
      if (op == kOpPing) {
        session->send(json{{"op", kOpPong}, {"body", json::object()}}.dump());
      } else if (op == kOpIdentify) {
        const auto body = signal->value("body", json::object());
        const auto token =
            common::JsonUtils::get_value<std::string>(body, "token");
        if (!config_.token.empty() && token != config_.token) {
          TGSATORI_WARN("事件连接鉴权失败");
          if (session->writing()) {
            beast::get_lowest_layer(session->ws).close();
          } else {
            co_await session->ws.async_close(
                websocket::close_reason(websocket::close_code::policy_error,
                                        "invalid token"),
                asio::use_awaitable);
          }
          break;
        }
        session->identified = true;
        json logins = json::array({adapter_.login().to_json()});
        session->send(
            json{{"op", kOpReady}, {"body", {{"logins", logins}}}}.dump());
      } else {
        TGSATORI_DEBUG("忽略事件信令 op={}", op);
      }
    }
  } catch (const beast::system_error &se) {
    if (se.code() == websocket::error::closed) {
      TGSATORI_INFO("事件连接已关闭");
    } else {
      TGSATORI_DEBUG("事件连接中断: {}", se.what());
    }
  }

  sessions_.remove(session);
}

auto SatoriServer::handle_request(const Request &request)
    -> asio::awaitable<Response> {
  const auto route = route_of(request);
  constexpr std::string_view internal_prefix = "/v1/internal/";
  constexpr std::string_view api_prefix = "/v1/";

  if (route.starts_with(internal_prefix)) {
    if (request.method() != http::verb::get) {
      co_return text_response(request, http::status::method_not_allowed,
                              "method not allowed");
    }
    co_return co_await handle_internal(
        request, route.substr(internal_prefix.size()));
  }

  if (route.starts_with(api_prefix) && route.size() > api_prefix.size()) {
    if (request.method() != http::verb::post) {
      co_return text_response(request, http::status::method_not_allowed,
                              "method not allowed");
    }
    co_return co_await handle_api(request, route.substr(api_prefix.size()));
  }

  co_return text_response(request, http::status::not_found, "not found");
}

auto SatoriServer::handle_api(const Request &request, std::string method)
    -> asio::awaitable<Response> {
  if (!authorized(request)) {
    co_return text_response(request, http::status::unauthorized,
                            "invalid token");
  }

  const auto platform = header_of(request, "Satori-Platform", "X-Platform");
  const auto self_id = header_of(request, "Satori-User-ID", "X-Self-ID");
  if ((!platform.empty() || !self_id.empty()) &&
      !adapter_.ensure(platform, self_id)) {
    co_return text_response(request, http::status::not_found,
                            "login not found");
  }

  json params = json::object();
  if (!request.body().empty()) {
    auto parsed = common::JsonUtils::parse(request.body());
    if (!parsed || !parsed->is_object()) {
      co_return text_response(request, http::status::bad_request,
                              "request body must be a JSON object");
    }
    params = std::move(*parsed);
  }

  // catch 块内不能 co_await，先记下结果
  auto status = http::status::ok;
  std::string error;
  json result;
  try {
    result = co_await adapter_.call(method, std::move(params));
  } catch (const MethodNotFoundError &e) {
    status = http::status::not_found;
    error = e.what();
  } catch (const ApiError &e) {
    status = http::status::bad_request;
    error = e.what();
  } catch (const satori::ElementError &e) {
    status = http::status::bad_request;
    error = e.what();
  } catch (const adapter::telegram::EncodeError &e) {
    status = http::status::bad_request;
    error = e.what();
  } catch (const std::exception &e) {
    TGSATORI_ERROR("Satori API {} 执行失败: {}", method, e.what());
    status = http::status::internal_server_error;
    error = e.what();
  }

  if (status != http::status::ok) {
    co_return text_response(request, status, std::move(error));
  }
  co_return make_response(request, status, result.dump(),
                          "application/json; charset=utf-8");
}

auto SatoriServer::handle_internal(const Request &request, std::string path)
    -> asio::awaitable<Response> {
  if (!authorized(request)) {
    co_return text_response(request, http::status::unauthorized,
                            "invalid token");
  }

  std::optional<std::string> data;
  std::string error;
  try {
    data = co_await adapter_.fetch_internal(path);
  } catch (const std::exception &e) {
    TGSATORI_ERROR("读取内部资源 {} 失败: {}", path, e.what());
    error = e.what();
  }

  if (!error.empty()) {
    co_return text_response(request, http::status::bad_gateway,
                            std::move(error));
  }
  if (!data) {
    co_return text_response(request, http::status::not_found, "not found");
  }
  const auto mime = network::FileFetcher::sniff_mime(*data);
  co_return make_response(request, http::status::ok, std::move(*data), mime);
}

bool SatoriServer::authorized(const Request &request) const {
  if (config_.token.empty()) {
    return true;
  }
  auto value = request[http::field::authorization];
  return std::string_view(value.data(), value.size()) ==
         "Bearer " + config_.token;
}

auto SatoriServer::route_of(const Request &request) const -> std::string {
  std::string_view target(request.target().data(), request.target().size());
  target = target.substr(0, target.find('?'));
  if (config_.path.empty()) {
    return std::string(target);
  }
  if (!target.starts_with(config_.path) ||
      target.substr(config_.path.size(), 1) != "/") {
    return {};
  }
  return std::string(target.substr(config_.path.size()));
}

} // namespace tgsatori::core
