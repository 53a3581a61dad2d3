#pragma once

#include "common/config_types.hpp"
#include "interfaces/bot_api.hpp"
#include "network/http_client.hpp"

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace tgsatori::network {

/**
 * @brief Bot API 返回 ok: false 时抛出
 */
class TelegramApiError : public std::runtime_error {
public:
  TelegramApiError(int error_code, const std::string &description)
      : std::runtime_error("Telegram API error " + std::to_string(error_code) +
                           ": " + description),
        error_code_(error_code), description_(description) {}

  auto error_code() const -> int { return error_code_; }
  auto description() const -> const std::string & { return description_; }

private:
  int error_code_;
  std::string description_;
};

/**
 * @brief multipart/form-data 中的文件字段
 */
struct MultipartFile {
  std::string field;
  std::string filename;
  std::string mime;
  std::string data;
};

/**
 * @brief Telegram Bot API连接管理器
 *
 * 通过HTTP POST发送API请求，通过 getUpdates 长轮询获取更新。
 * 轮询在独立线程上执行，更新回调被投递回主 io_context。
 */
class TelegramConnectionManager : public IBotApi {
public:
  using UpdateCallback = std::function<void(const nlohmann::json &)>;

  TelegramConnectionManager(asio::io_context &ioc,
                            common::AdapterConfig config);
  ~TelegramConnectionManager() override;

  void connect();
  void disconnect();
  bool is_connected() const;

  /**
   * @brief 设置更新回调，每个 update 对象调用一次
   */
  void set_update_callback(UpdateCallback callback);

  /**
   * @brief 开始更新轮询
   */
  void start_polling();

  /**
   * @brief 停止更新轮询
   */
  void stop_polling();

  asio::awaitable<telegram::User> get_me() override;
  asio::awaitable<telegram::User> get_user(int64_t user_id) override;
  asio::awaitable<telegram::Message> send_message(
      telegram::ChatTarget target, std::string text,
      std::optional<int64_t> reply_to, InlineKeyboard keyboard) override;
  asio::awaitable<telegram::Message> edit_message_text(
      telegram::ChatTarget target, int64_t message_id, std::string text,
      InlineKeyboard keyboard) override;
  asio::awaitable<std::vector<telegram::Message>> send_media_group(
      telegram::ChatTarget target, std::vector<InputMedia> media,
      std::optional<int64_t> reply_to) override;
  asio::awaitable<telegram::Message> send_animation(
      telegram::ChatTarget target, InputMedia animation,
      std::optional<int64_t> reply_to) override;
  asio::awaitable<void> answer_callback_query(
      std::string callback_query_id, std::optional<std::string> text) override;
  asio::awaitable<std::string> get_file_content(std::string file_id) override;

  /**
   * @brief 以 JSON 调用 Bot API 方法
   * @return 响应中的 result 字段
   * @throws TelegramApiError ok 为 false
   */
  asio::awaitable<nlohmann::json> call_api(std::string method,
                                           nlohmann::json params);

  /**
   * @brief 解析 Bot API 响应，返回 result 字段
   * @throws TelegramApiError ok 为 false
   * @throws HttpClientError 响应不是 JSON
   */
  static auto parse_api_response(const HttpResponse &response)
      -> nlohmann::json;

  static auto build_multipart(const std::string &boundary,
                              const std::map<std::string, std::string> &fields,
                              const std::vector<MultipartFile> &files)
      -> std::string;

  static auto keyboard_to_json(const InlineKeyboard &keyboard)
      -> nlohmann::json;

  /**
   * @brief 构造 sendMediaGroup 的 media 字段和对应的文件，media 中的数据被移走
   */
  static auto media_group_payload(std::vector<InputMedia> &media)
      -> std::pair<nlohmann::json, std::vector<MultipartFile>>;

  static constexpr size_t kMaxMediaGroupSize = 10;

private:
  asio::awaitable<nlohmann::json> call_multipart(
      std::string method, std::map<std::string, std::string> fields,
      std::vector<MultipartFile> files);

  asio::awaitable<telegram::Message> send_single_media(
      telegram::ChatTarget target, InputMedia media,
      std::optional<int64_t> reply_to);

  auto target_fields(const telegram::ChatTarget &target,
                     std::optional<int64_t> reply_to) const
      -> std::map<std::string, std::string>;

  auto api_path(std::string_view method) const -> std::string;

  /**
   * @brief 轮询更新的协程
   */
  asio::awaitable<void> poll_updates();

  /**
   * @brief 处理轮询到的更新
   * @param updates 更新JSON数组
   */
  void process_updates(const nlohmann::json &updates);

  asio::io_context &ioc_;
  common::AdapterConfig config_;
  UpdateCallback update_callback_;

  std::unique_ptr<HttpClient> http_client_;
  std::unique_ptr<HttpClient> poll_client_;

  // 轮询控制
  std::atomic<bool> is_polling_{false};
  std::atomic<bool> is_connected_{false};
  asio::thread_pool poll_pool_{1};
  asio::steady_timer poll_timer_;

  // 更新偏移量
  int64_t update_offset_{0};
};

} // namespace tgsatori::network
