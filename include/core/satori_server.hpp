#pragma once

#include "common/config_types.hpp"
#include "core/satori_adapter.hpp"
#include "satori/model.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <list>
#include <memory>
#include <string>

namespace tgsatori::core {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

class EventSession;

/**
 * \if CHINESE
 * @brief Satori 协议服务端
 *
 * 在同一端口上提供：
 * - `POST {path}/v1/{method}`：转交 SatoriAdapter::call
 * - `GET {path}/v1/internal/{path}`：转交 SatoriAdapter::fetch_internal
 * - `{path}/v1/events`：事件 WebSocket，IDENTIFY 后推送事件
 *
 * 所有连接都运行在构造时传入的 io_context 上。
 * \endif
 * \if ENGLISH
 * @brief Satori protocol server.
 *
 * Serves the HTTP API, internal resources and the event WebSocket on one
 * port. Every connection runs on the io_context given at construction.
 * \endif
 */
class SatoriServer {
public:
  using Request = http::request<http::string_body>;
  using Response = http::response<http::string_body>;

  // Satori WebSocket 信令
  enum Opcode : int {
    kOpEvent = 0,
    kOpPing = 1,
    kOpPong = 2,
    kOpIdentify = 3,
    kOpReady = 4,
  };

  SatoriServer(asio::io_context &ioc, common::ServerConfig config,
               SatoriAdapter &adapter);
  ~SatoriServer();

  SatoriServer(const SatoriServer &) = delete;
  SatoriServer &operator=(const SatoriServer &) = delete;

  /**
   * @brief 绑定端口并开始接受连接
   * @throws boost::system::system_error 地址无效或端口被占用
   */
  void start();

  /**
   * @brief 关闭监听和所有事件连接，须在 io_context 线程上调用
   */
  void stop();

  /**
   * @brief 向所有已鉴权的事件连接推送事件，可在任意线程调用
   */
  void broadcast(const satori::Event &event);

  /**
   * @brief 实际监听的端口（配置为 0 时由系统分配）
   */
  auto port() const -> uint16_t;

  auto config() const -> const common::ServerConfig & { return config_; }

private:
  asio::awaitable<void> accept_loop();
  asio::awaitable<void> serve_connection(tcp::socket socket);
  asio::awaitable<void> serve_events(beast::tcp_stream stream,
                                     Request request);
  asio::awaitable<Response> handle_request(const Request &request);
  asio::awaitable<Response> handle_api(const Request &request,
                                       std::string method);
  asio::awaitable<Response> handle_internal(const Request &request,
                                            std::string path);

  bool authorized(const Request &request) const;
  // 去掉查询串和路由前缀，不在前缀下时返回空串
  auto route_of(const Request &request) const -> std::string;

  asio::io_context &ioc_;
  common::ServerConfig config_;
  SatoriAdapter &adapter_;
  tcp::acceptor acceptor_;
  std::list<std::shared_ptr<EventSession>> sessions_;
};

} // namespace tgsatori::core
