#include "telegram/types.hpp"
#include "common/json_utils.hpp"

#include <charconv>

namespace tgsatori::telegram {

using common::JsonUtils::get_optional;
using common::JsonUtils::get_value;

namespace {
auto big_photo_of(const json &j) -> std::optional<std::string> {
  if (j.is_object() && j.contains("photo") && j["photo"].is_object()) {
    return get_optional<std::string>(j["photo"], "big_file_id");
  }
  return std::nullopt;
}

auto entities_of(const json &j, const std::string &key)
    -> std::vector<MessageEntity> {
  std::vector<MessageEntity> entities;
  if (j.contains(key) && j[key].is_array()) {
    for (const auto &entity : j[key]) {
      entities.push_back(MessageEntity::from_json(entity));
    }
  }
  return entities;
}

auto attachment_of(const json &j, const std::string &key)
    -> std::optional<FileAttachment> {
  if (j.contains(key) && j[key].is_object()) {
    return FileAttachment::from_json(j[key]);
  }
  return std::nullopt;
}

auto parse_int(std::string_view text) -> std::optional<int64_t> {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}
} // namespace

auto User::from_json(const json &j) -> User {
  User user;
  user.id = j.at("id").get<int64_t>();
  user.is_bot = get_value<bool>(j, "is_bot", false);
  user.first_name = get_value<std::string>(j, "first_name");
  user.last_name = get_optional<std::string>(j, "last_name");
  user.username = get_optional<std::string>(j, "username");
  user.big_photo_file_id = big_photo_of(j);
  return user;
}

auto Chat::from_json(const json &j) -> Chat {
  Chat chat;
  chat.id = j.at("id").get<int64_t>();
  chat.type = get_value<std::string>(j, "type", "private");
  chat.title = get_optional<std::string>(j, "title");
  chat.username = get_optional<std::string>(j, "username");
  chat.first_name = get_optional<std::string>(j, "first_name");
  chat.last_name = get_optional<std::string>(j, "last_name");
  chat.big_photo_file_id = big_photo_of(j);
  chat.is_forum = get_value<bool>(j, "is_forum", false);
  return chat;
}

auto MessageEntity::from_json(const json &j) -> MessageEntity {
  MessageEntity entity;
  entity.type = get_value<std::string>(j, "type");
  entity.offset = get_value<int64_t>(j, "offset", 0);
  entity.length = get_value<int64_t>(j, "length", 0);
  entity.url = get_optional<std::string>(j, "url");
  if (j.contains("user") && j["user"].is_object()) {
    entity.user = User::from_json(j["user"]);
  }
  entity.language = get_optional<std::string>(j, "language");
  return entity;
}

auto FileAttachment::from_json(const json &j) -> FileAttachment {
  FileAttachment attachment;
  attachment.file_id = get_value<std::string>(j, "file_id");
  attachment.file_name = get_optional<std::string>(j, "file_name");
  attachment.mime_type = get_optional<std::string>(j, "mime_type");
  return attachment;
}

auto Message::largest_photo() const -> const PhotoSize * {
  const PhotoSize *largest = nullptr;
  for (const auto &size : photo) {
    if (!largest ||
        size.width * size.height > largest->width * largest->height) {
      largest = &size;
    }
  }
  return largest;
}

auto Message::from_json(const json &j) -> Message {
  Message message;
  message.message_id = j.at("message_id").get<int64_t>();
  message.chat = Chat::from_json(j.at("chat"));
  message.message_thread_id = get_optional<int64_t>(j, "message_thread_id");
  if (j.contains("from") && j["from"].is_object()) {
    message.from = User::from_json(j["from"]);
  }
  message.date = get_value<int64_t>(j, "date", 0);
  message.edit_date = get_optional<int64_t>(j, "edit_date");

  message.text = get_optional<std::string>(j, "text");
  message.caption = get_optional<std::string>(j, "caption");
  message.entities = entities_of(j, "entities");
  message.caption_entities = entities_of(j, "caption_entities");

  if (j.contains("reply_to_message") && j["reply_to_message"].is_object()) {
    message.reply_to_message =
        std::make_shared<Message>(Message::from_json(j["reply_to_message"]));
  }
  message.is_topic_message = get_value<bool>(j, "is_topic_message", false);
  message.forum_topic_created = j.contains("forum_topic_created");

  if (j.contains("photo") && j["photo"].is_array()) {
    for (const auto &size : j["photo"]) {
      PhotoSize photo;
      photo.file_id = get_value<std::string>(size, "file_id");
      photo.width = get_value<int64_t>(size, "width", 0);
      photo.height = get_value<int64_t>(size, "height", 0);
      photo.file_size = get_optional<int64_t>(size, "file_size");
      message.photo.push_back(std::move(photo));
    }
  }
  message.sticker = attachment_of(j, "sticker");
  message.voice = attachment_of(j, "voice");
  message.animation = attachment_of(j, "animation");
  message.video = attachment_of(j, "video");
  message.document = attachment_of(j, "document");
  message.audio = attachment_of(j, "audio");
  if (j.contains("location") && j["location"].is_object()) {
    Location location;
    location.latitude = get_value<double>(j["location"], "latitude", 0.0);
    location.longitude = get_value<double>(j["location"], "longitude", 0.0);
    message.location = location;
  }
  return message;
}

auto CallbackQuery::from_json(const json &j) -> CallbackQuery {
  CallbackQuery query;
  query.id = j.at("id").get<std::string>();
  query.from = User::from_json(j.at("from"));
  if (j.contains("message") && j["message"].is_object()) {
    query.message = Message::from_json(j["message"]);
  }
  query.data = get_optional<std::string>(j, "data");
  return query;
}

auto ChatTarget::parse(std::string_view channel_id)
    -> std::optional<ChatTarget> {
  ChatTarget target;
  const auto colon = channel_id.find(':');
  auto chat_id = parse_int(channel_id.substr(0, colon));
  if (!chat_id) {
    return std::nullopt;
  }
  target.chat_id = *chat_id;
  if (colon != std::string_view::npos) {
    auto thread_id = parse_int(channel_id.substr(colon + 1));
    if (!thread_id) {
      return std::nullopt;
    }
    target.thread_id = thread_id;
  }
  return target;
}

auto ChatTarget::to_channel_id() const -> std::string {
  if (thread_id) {
    return std::to_string(chat_id) + ":" + std::to_string(*thread_id);
  }
  return std::to_string(chat_id);
}

} // namespace tgsatori::telegram
