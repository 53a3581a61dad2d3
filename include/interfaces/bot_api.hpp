#pragma once

#include "telegram/types.hpp"

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tgsatori::network {
namespace asio = boost::asio;

/**
 * @brief 内联键盘按钮：标签加上 url / 预填查询 / 回调数据三者之一
 */
struct InlineButton {
  enum class Action { url, query, callback };

  std::string text;
  Action action = Action::callback;
  std::string value;

  auto to_json() const -> nlohmann::json;
};

using InlineKeyboardRow = std::vector<InlineButton>;
using InlineKeyboard = std::vector<InlineKeyboardRow>;

/**
 * @brief 待上传的媒体
 */
struct InputMedia {
  enum class Kind { photo, video, audio, document, animation };

  Kind kind = Kind::document;
  std::string filename;
  std::string data;
  std::string mime;
  std::optional<std::string> caption;
  bool has_spoiler = false;
};

auto to_string(InputMedia::Kind kind) -> const char *;

/**
 * @brief Telegram Bot API 抽象接口
 *
 * 编码器与适配器只依赖此接口，所有文本均以 HTML parse_mode 发送。
 * 实现在失败时抛出异常（HttpClientError、TelegramApiError 等）。
 */
class IBotApi {
public:
  virtual ~IBotApi() = default;

  virtual asio::awaitable<telegram::User> get_me() = 0;

  /**
   * @brief 获取用户资料（含头像 file_id）
   */
  virtual asio::awaitable<telegram::User> get_user(int64_t user_id) = 0;

  /**
   * @brief 发送 HTML 文本消息
   * @param keyboard 为空时不附带 reply_markup
   */
  virtual asio::awaitable<telegram::Message> send_message(
      telegram::ChatTarget target, std::string text,
      std::optional<int64_t> reply_to, InlineKeyboard keyboard) = 0;

  virtual asio::awaitable<telegram::Message> edit_message_text(
      telegram::ChatTarget target, int64_t message_id, std::string text,
      InlineKeyboard keyboard) = 0;

  /**
   * @brief 以一组的形式发送多个媒体
   * @return 按顺序产生的消息
   */
  virtual asio::awaitable<std::vector<telegram::Message>> send_media_group(
      telegram::ChatTarget target, std::vector<InputMedia> media,
      std::optional<int64_t> reply_to) = 0;

  virtual asio::awaitable<telegram::Message> send_animation(
      telegram::ChatTarget target, InputMedia animation,
      std::optional<int64_t> reply_to) = 0;

  virtual asio::awaitable<void> answer_callback_query(
      std::string callback_query_id, std::optional<std::string> text) = 0;

  /**
   * @brief 下载文件内容
   * @param file_id Telegram 文件 ID
   * @return 文件的二进制数据
   */
  virtual asio::awaitable<std::string> get_file_content(std::string file_id) = 0;
};

} // namespace tgsatori::network
