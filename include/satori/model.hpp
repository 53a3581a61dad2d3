#pragma once

#include "satori/element.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tgsatori::satori {

struct User {
  std::string id;
  std::optional<std::string> name;
  std::optional<std::string> nick;
  std::optional<std::string> avatar;
  std::optional<bool> is_bot;

  auto to_json() const -> json;
};

enum class ChannelType { text = 0, direct = 1, category = 2, voice = 3 };

struct Channel {
  std::string id;
  ChannelType type = ChannelType::text;
  std::optional<std::string> name;

  auto to_json() const -> json;
};

struct Guild {
  std::string id;
  std::optional<std::string> name;
  std::optional<std::string> avatar;

  auto to_json() const -> json;
};

enum class LoginStatus {
  offline = 0,
  online = 1,
  connect = 2,
  disconnect = 3,
  reconnect = 4
};

struct Login {
  int64_t sn = 0;
  LoginStatus status = LoginStatus::offline;
  std::string adapter;
  std::string platform;
  std::optional<User> user;

  auto to_json() const -> json;
};

/**
 * @brief 一条已解码的消息：id 与内容元素
 */
struct MessageObject {
  std::string id;
  std::vector<Element> elements;
  std::optional<int64_t> created_at;

  auto content() const -> std::string;
  auto to_json() const -> json;
};

struct Button {
  std::string id;

  auto to_json() const -> json;
};

/**
 * \if CHINESE
 * @brief Satori 事件
 * \endif
 * \if ENGLISH
 * @brief A Satori event, e.g. `message-created` or `interaction/button`.
 * \endif
 */
struct Event {
  int64_t sn = 0;
  std::string type;
  int64_t timestamp = 0;
  Login login;
  std::optional<Channel> channel;
  std::optional<Guild> guild;
  std::optional<User> user;
  std::optional<MessageObject> message;
  std::optional<Button> button;

  auto to_json() const -> json;
};

} // namespace tgsatori::satori
