#pragma once

#include "common/config_types.hpp"
#include "interfaces/bot_api.hpp"
#include "interfaces/file_fetcher.hpp"
#include "satori/model.hpp"

#include <boost/asio/awaitable.hpp>
#include <atomic>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tgsatori::core {

namespace asio = boost::asio;

/**
 * @brief Satori API 调用错误（未知方法或缺少参数）
 */
class ApiError : public std::runtime_error {
public:
  explicit ApiError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief 请求了适配器不支持的 Satori API 方法
 */
class MethodNotFoundError : public ApiError {
public:
  explicit MethodNotFoundError(const std::string &method)
      : ApiError("unknown method: " + method) {}
};

/**
 * \if CHINESE
 * @brief Telegram 到 Satori 的适配器
 *
 * 将 Bot API 更新转换为 Satori 事件，并把 Satori API 调用转换为 Bot API
 * 请求。
 * \endif
 * \if ENGLISH
 * @brief Adapter between the Telegram Bot API and the Satori protocol.
 *
 * Turns Bot API updates into Satori events and Satori API calls into Bot API
 * requests.
 * \endif
 */
class SatoriAdapter {
public:
  using EventCallback = std::function<void(const satori::Event &)>;

  static constexpr std::string_view kAdapterName = "tgsatori";

  SatoriAdapter(network::IBotApi &api, network::IFileFetcher &fetcher,
                common::AdapterConfig config);

  /**
   * @brief 通过 getMe 获取自身信息并上线
   */
  asio::awaitable<satori::Login> start();

  void set_event_callback(EventCallback callback);

  /**
   * @brief 处理一个 Bot API update，产生的事件交给事件回调
   */
  asio::awaitable<void> handle_update(nlohmann::json update);

  /**
   * @brief 调用 Satori API
   * @param method login.get / user.get / message.create / message.update
   * @throws MethodNotFoundError 未知方法
   * @throws ApiError 缺少参数或参数无效
   */
  asio::awaitable<nlohmann::json> call(std::string method,
                                       nlohmann::json params);

  /**
   * @brief 读取内部定位符指向的文件
   * @param path `internal:` 之后的部分
   * @return 平台或账号不匹配时返回 std::nullopt
   */
  asio::awaitable<std::optional<std::string>> fetch_internal(std::string path);

  /**
   * @brief 请求头中的平台与账号是否指向本适配器
   */
  bool ensure(std::string_view platform, std::string_view self_id) const;

  auto login() const -> const satori::Login & { return login_; }
  auto self_id() const -> const std::string & { return self_id_; }

private:
  void emit(satori::Event event);
  auto make_event(std::string type) -> satori::Event;
  void handle_message(const nlohmann::json &raw, const std::string &type);
  asio::awaitable<void> handle_callback_query(const nlohmann::json &raw);

  network::IBotApi &api_;
  network::IFileFetcher &fetcher_;
  common::AdapterConfig config_;
  EventCallback event_callback_;

  std::string self_id_;
  satori::Login login_;
  std::atomic<int64_t> next_sn_{1};
};

} // namespace tgsatori::core
