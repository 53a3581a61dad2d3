#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tgsatori::telegram {

using json = nlohmann::json;

/**
 * @brief Telegram Bot API 对象的最小子集
 *
 * 所有 from_json 对缺失的可选字段保持宽容；只有必需字段缺失时才抛出
 * nlohmann::json::exception。
 */
struct User {
  int64_t id = 0;
  bool is_bot = false;
  std::string first_name;
  std::optional<std::string> last_name;
  std::optional<std::string> username;
  // 仅 getChat 返回，普通 User 对象不含头像
  std::optional<std::string> big_photo_file_id;

  static auto from_json(const json &j) -> User;
};

struct Chat {
  int64_t id = 0;
  std::string type;
  std::optional<std::string> title;
  std::optional<std::string> username;
  std::optional<std::string> first_name;
  std::optional<std::string> last_name;
  std::optional<std::string> big_photo_file_id;
  bool is_forum = false;

  auto is_private() const -> bool { return type == "private"; }

  static auto from_json(const json &j) -> Chat;
};

struct MessageEntity {
  std::string type;
  int64_t offset = 0;
  int64_t length = 0;
  std::optional<std::string> url;
  std::optional<User> user;
  std::optional<std::string> language;

  static auto from_json(const json &j) -> MessageEntity;
};

struct PhotoSize {
  std::string file_id;
  int64_t width = 0;
  int64_t height = 0;
  std::optional<int64_t> file_size;
};

// sticker/voice/animation/video/document/audio 共用
struct FileAttachment {
  std::string file_id;
  std::optional<std::string> file_name;
  std::optional<std::string> mime_type;

  static auto from_json(const json &j) -> FileAttachment;
};

struct Location {
  double latitude = 0;
  double longitude = 0;
};

struct Message {
  int64_t message_id = 0;
  std::optional<int64_t> message_thread_id;
  std::optional<User> from;
  Chat chat;
  int64_t date = 0;
  std::optional<int64_t> edit_date;

  std::optional<std::string> text;
  std::optional<std::string> caption;
  std::vector<MessageEntity> entities;
  std::vector<MessageEntity> caption_entities;

  std::shared_ptr<Message> reply_to_message;
  bool is_topic_message = false;
  bool forum_topic_created = false;

  std::vector<PhotoSize> photo;
  std::optional<FileAttachment> sticker;
  std::optional<FileAttachment> voice;
  std::optional<FileAttachment> animation;
  std::optional<FileAttachment> video;
  std::optional<FileAttachment> document;
  std::optional<FileAttachment> audio;
  std::optional<Location> location;

  /**
   * @brief 返回尺寸最大的照片
   */
  auto largest_photo() const -> const PhotoSize *;

  static auto from_json(const json &j) -> Message;
};

struct CallbackQuery {
  std::string id;
  User from;
  std::optional<Message> message;
  std::optional<std::string> data;

  static auto from_json(const json &j) -> CallbackQuery;
};

/**
 * \if CHINESE
 * @brief 发送目标：会话 ID 与可选的话题 ID
 * \endif
 * \if ENGLISH
 * @brief Outgoing target. Forum topics are addressed by the Satori channel id
 * `"<chat_id>:<thread_id>"`.
 * \endif
 */
struct ChatTarget {
  int64_t chat_id = 0;
  std::optional<int64_t> thread_id;

  static auto parse(std::string_view channel_id) -> std::optional<ChatTarget>;
  auto to_channel_id() const -> std::string;
};

} // namespace tgsatori::telegram
