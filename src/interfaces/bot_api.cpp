#include "interfaces/bot_api.hpp"

namespace tgsatori::network {

auto InlineButton::to_json() const -> nlohmann::json {
  nlohmann::json j = {{"text", text}};
  switch (action) {
  case Action::url:
    j["url"] = value;
    break;
  case Action::query:
    j["switch_inline_query_current_chat"] = value;
    break;
  case Action::callback:
    j["callback_data"] = value;
    break;
  }
  return j;
}

auto to_string(InputMedia::Kind kind) -> const char * {
  switch (kind) {
  case InputMedia::Kind::photo:
    return "photo";
  case InputMedia::Kind::video:
    return "video";
  case InputMedia::Kind::audio:
    return "audio";
  case InputMedia::Kind::document:
    return "document";
  case InputMedia::Kind::animation:
    return "animation";
  }
  return "document";
}

} // namespace tgsatori::network
