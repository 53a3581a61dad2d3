#pragma once

#include "interfaces/bot_api.hpp"
#include "interfaces/file_fetcher.hpp"
#include "satori/element.hpp"
#include "satori/model.hpp"
#include "telegram/types.hpp"

#include <boost/asio/awaitable.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tgsatori::adapter::telegram {

namespace asio = boost::asio;
namespace tg = tgsatori::telegram;

/**
 * @brief 编码约定被违反（编辑消息时包含附件或需要多条消息等）
 */
class EncodeError : public std::runtime_error {
public:
  explicit EncodeError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * \if CHINESE
 * @brief 多步发送中的第一个失败，附带已经发出的消息
 * \endif
 * \if ENGLISH
 * @brief First failure of a multi-step send. Messages sent before the failure
 * are not rolled back and are reported through delivered().
 * \endif
 */
class DeliveryError : public std::runtime_error {
public:
  DeliveryError(const std::string &message,
                std::vector<satori::MessageObject> delivered)
      : std::runtime_error(message), delivered_(std::move(delivered)) {}

  auto delivered() const -> const std::vector<satori::MessageObject> & {
    return delivered_;
  }

private:
  std::vector<satori::MessageObject> delivered_;
};

inline constexpr size_t kMaxButtonsPerRow = 5;

/**
 * @brief 编码器的可变状态，每次 flush 之后通过 reset() 清空
 */
struct EncoderAccumulator {
  enum class Mode { normal, figure };

  std::string content;
  std::vector<satori::Element> pending_assets;
  Mode mode = Mode::normal;
  std::optional<int64_t> pending_reply_target;
  network::InlineKeyboard rows;

  /**
   * @brief 是否存在非空的按钮行
   */
  auto has_buttons() const -> bool;

  /**
   * @brief 去掉空行后的键盘
   */
  auto keyboard() const -> network::InlineKeyboard;

  auto empty() const -> bool {
    return content.empty() && pending_assets.empty();
  }

  // mode 由 figure 元素自行恢复，不在此处重置
  void reset();
};

/**
 * \if CHINESE
 * @brief Satori 元素到 Telegram HTML 的编码器基类
 *
 * 发送与编辑共用同一张分派表，区别仅在 flush 如何处理完成的缓冲区。
 * \endif
 * \if ENGLISH
 * @brief Base encoder from Satori elements to Telegram HTML.
 *
 * The send and update encoders share one dispatch table and differ only in
 * what flush() does with a completed buffer.
 * \endif
 */
class MessageEncoder {
public:
  virtual ~MessageEncoder() = default;

  asio::awaitable<void> render(const std::vector<satori::Element> &elements);
  asio::awaitable<void> visit(const satori::Element &element);

  virtual asio::awaitable<void> flush() = 0;

  auto state() const -> const EncoderAccumulator & { return acc_; }

protected:
  EncoderAccumulator acc_;

private:
  void add_button(const satori::Element &element);
  asio::awaitable<void> wrap(const satori::Element &element, std::string open,
                             std::string close);
};

/**
 * \if CHINESE
 * @brief 发送编码器：每次 flush 产生零个或多个发送操作
 * \endif
 * \if ENGLISH
 * @brief Send encoder. Each flush issues zero or more send operations and
 * decodes every produced message back into the result list.
 * \endif
 */
class SendMessageEncoder : public MessageEncoder {
public:
  SendMessageEncoder(network::IBotApi &api, network::IFileFetcher &fetcher,
                     std::string self_id, tg::ChatTarget target,
                     int default_timeout_s = 30);

  asio::awaitable<void> flush() override;

  auto results() const -> const std::vector<satori::MessageObject> & {
    return results_;
  }

private:
  void add_result(const tg::Message &message);
  asio::awaitable<void> deliver();

  network::IBotApi &api_;
  network::IFileFetcher &fetcher_;
  std::string self_id_;
  tg::ChatTarget target_;
  int default_timeout_s_;
  std::vector<satori::MessageObject> results_;
};

/**
 * @brief 编辑编码器：只允许产生唯一一个纯文本单元
 */
class UpdateMessageEncoder : public MessageEncoder {
public:
  struct Unit {
    std::string content;
    network::InlineKeyboard keyboard;
  };

  asio::awaitable<void> flush() override;

  auto unit() const -> const std::optional<Unit> & { return unit_; }

private:
  std::optional<Unit> unit_;
};

/**
 * @brief 解析消息编码并发送到目标频道
 * @return 按发送顺序解码后的消息
 * @throws satori::ElementError 元素缺少必需属性
 * @throws DeliveryError 任一发送或附件获取失败
 */
asio::awaitable<std::vector<satori::MessageObject>> send_message(
    network::IBotApi &api, network::IFileFetcher &fetcher, std::string self_id,
    tg::ChatTarget target, std::string markup, int default_timeout_s = 30);

/**
 * @brief 以一次 edit_message_text 编辑已有消息
 * @throws EncodeError 内容包含附件、需要多条消息或为空（不会发出任何请求）
 */
asio::awaitable<void> update_message(network::IBotApi &api,
                                     tg::ChatTarget target, int64_t message_id,
                                     std::string markup);

} // namespace tgsatori::adapter::telegram
