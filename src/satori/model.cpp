#include "satori/model.hpp"
#include "satori/markup.hpp"

namespace tgsatori::satori {

namespace {
template <typename T>
void put_optional(json &j, const char *key, const std::optional<T> &value) {
  if (value) {
    j[key] = *value;
  }
}
} // namespace

auto User::to_json() const -> json {
  json j = {{"id", id}};
  put_optional(j, "name", name);
  put_optional(j, "nick", nick);
  put_optional(j, "avatar", avatar);
  put_optional(j, "is_bot", is_bot);
  return j;
}

auto Channel::to_json() const -> json {
  json j = {{"id", id}, {"type", static_cast<int>(type)}};
  put_optional(j, "name", name);
  return j;
}

auto Guild::to_json() const -> json {
  json j = {{"id", id}};
  put_optional(j, "name", name);
  put_optional(j, "avatar", avatar);
  return j;
}

auto Login::to_json() const -> json {
  json j = {{"sn", sn},
            {"status", static_cast<int>(status)},
            {"adapter", adapter},
            {"platform", platform},
            {"features", json::array({"message.create", "message.update",
                                      "user.get", "login.get"})}};
  if (user) {
    j["user"] = user->to_json();
  }
  return j;
}

auto MessageObject::content() const -> std::string { return dumps(elements); }

auto MessageObject::to_json() const -> json {
  json j = {{"id", id}, {"content", content()}};
  put_optional(j, "created_at", created_at);
  return j;
}

auto Button::to_json() const -> json { return {{"id", id}}; }

auto Event::to_json() const -> json {
  json j = {{"sn", sn},
            {"type", type},
            {"timestamp", timestamp},
            {"login", login.to_json()}};
  if (channel) {
    j["channel"] = channel->to_json();
  }
  if (guild) {
    j["guild"] = guild->to_json();
  }
  if (user) {
    j["user"] = user->to_json();
  }
  if (message) {
    j["message"] = message->to_json();
  }
  if (button) {
    j["button"] = button->to_json();
  }
  return j;
}

} // namespace tgsatori::satori
