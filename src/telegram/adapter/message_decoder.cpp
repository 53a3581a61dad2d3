#include "telegram/adapter/message_decoder.hpp"
#include "common/logger.hpp"
#include "telegram/adapter/locator.hpp"
#include "telegram/adapter/user_parser.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>

namespace tgsatori::adapter::telegram {

using satori::Element;
using satori::json;

namespace {

enum class Edge { start, end };

struct Breakpoint {
  size_t pos;
  Edge edge;
  // nullptr 表示由换行符生成的断点
  const tg::MessageEntity *entity;
};

struct StyleState {
  bool bold = false;
  bool italic = false;
  bool underline = false;
  bool strikethrough = false;
  bool code = false;
  bool pre = false;
  bool spoiler = false;
  bool mention = false;
  std::optional<std::string> link;
  std::optional<tg::User> user;
};

constexpr std::array<std::string_view, 10> kRecognizedEntities = {
    "bold",   "italic",  "underline", "strikethrough", "code",
    "pre",    "spoiler", "mention",   "text_link",     "text_mention"};

auto is_recognized(std::string_view type) -> bool {
  return std::find(kRecognizedEntities.begin(), kRecognizedEntities.end(),
                   type) != kRecognizedEntities.end();
}

auto utf8_length(unsigned char lead) -> size_t {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 1;
}

void apply(StyleState &state, const Breakpoint &breakpoint) {
  const auto &entity = *breakpoint.entity;
  const bool on = breakpoint.edge == Edge::start;
  const auto &type = entity.type;
  if (type == "bold") {
    state.bold = on;
  } else if (type == "italic") {
    state.italic = on;
  } else if (type == "underline") {
    state.underline = on;
  } else if (type == "strikethrough") {
    state.strikethrough = on;
  } else if (type == "code") {
    state.code = on;
  } else if (type == "pre") {
    state.pre = on;
  } else if (type == "spoiler") {
    state.spoiler = on;
  } else if (type == "mention") {
    state.mention = on;
  } else if (type == "text_link") {
    state.link = on ? std::optional<std::string>(entity.url.value_or(""))
                    : std::nullopt;
  } else if (type == "text_mention") {
    state.user = on ? entity.user : std::nullopt;
  }
}

auto wrap(Element inner, std::string tag, json attrs = json::object())
    -> Element {
  std::vector<Element> children;
  children.push_back(std::move(inner));
  return Element::make(std::move(tag), std::move(attrs), std::move(children));
}

// "@name" -> "name"
auto drop_marker(std::string_view run) -> std::string {
  if (run.empty()) {
    return {};
  }
  const auto skip =
      std::min(utf8_length(static_cast<unsigned char>(run.front())), run.size());
  return std::string(run.substr(skip));
}

auto styled_run(std::string_view run, const StyleState &state) -> Element {
  if (run == "\n") {
    return Element::make("br");
  }

  Element element = Element::text(std::string(run));
  if (state.bold) {
    element = wrap(std::move(element), "b");
  }
  if (state.italic) {
    element = wrap(std::move(element), "i");
  }
  if (state.underline) {
    element = wrap(std::move(element), "u");
  }
  if (state.strikethrough) {
    element = wrap(std::move(element), "s");
  }
  if (state.code) {
    element = wrap(std::move(element), "code");
  }
  if (state.pre) {
    element = wrap(std::move(element), "pre");
  }
  if (state.spoiler) {
    element = wrap(std::move(element), "spl");
  }
  if (state.mention) {
    // 提及不允许嵌套格式，直接用原始文本重新构造
    element = wrap(Element::text(std::string(run)), "at",
                   {{"name", drop_marker(run)}});
  }
  if (state.link) {
    element = wrap(std::move(element), "a", {{"href", *state.link}});
  }
  if (state.user) {
    json attrs = {{"id", std::to_string(state.user->id)}};
    if (state.user->username) {
      attrs["name"] = *state.user->username;
    }
    element = wrap(std::move(element), "at", std::move(attrs));
  }
  return element;
}

auto optional_json(const std::optional<std::string> &value) -> json {
  return value ? json(*value) : json(nullptr);
}

auto file_element(const std::string &tag, const std::string &self_id,
                  const tg::FileAttachment &file, bool with_title) -> Element {
  json attrs = {{"src", make_locator(self_id, file.file_id)}};
  if (with_title && file.file_name) {
    attrs["title"] = *file.file_name;
  }
  return Element::make(tag, std::move(attrs));
}

} // namespace

Utf16Index::Utf16Index(std::string_view text) : size_(text.size()) {
  byte_of_unit_.reserve(text.size() + 1);
  size_t i = 0;
  while (i < text.size()) {
    const auto length =
        std::min(utf8_length(static_cast<unsigned char>(text[i])),
                 text.size() - i);
    byte_of_unit_.push_back(i);
    if (length == 4) {
      // 代理对的低位单元映射到下一个字符边界
      byte_of_unit_.push_back(i + length);
    }
    i += length;
  }
  byte_of_unit_.push_back(text.size());
}

auto Utf16Index::to_byte(int64_t utf16_offset) const -> size_t {
  if (utf16_offset <= 0) {
    return 0;
  }
  const auto index = static_cast<size_t>(utf16_offset);
  if (index >= byte_of_unit_.size()) {
    return size_;
  }
  return byte_of_unit_[index];
}

auto parse_text(std::string_view text,
                const std::vector<tg::MessageEntity> &entities)
    -> std::vector<Element> {
  const Utf16Index index(text);

  std::vector<Breakpoint> breakpoints;
  for (const auto &entity : entities) {
    if (!is_recognized(entity.type)) {
      continue;
    }
    breakpoints.push_back({index.to_byte(entity.offset), Edge::start, &entity});
    breakpoints.push_back(
        {index.to_byte(entity.offset + entity.length), Edge::end, &entity});
  }
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      breakpoints.push_back({i, Edge::start, nullptr});
      breakpoints.push_back({i + 1, Edge::end, nullptr});
    }
  }
  std::stable_sort(breakpoints.begin(), breakpoints.end(),
                   [](const Breakpoint &lhs, const Breakpoint &rhs) {
                     return lhs.pos < rhs.pos;
                   });
  TGSATORI_TRACE("parse_text: {} bytes, {} breakpoints", text.size(),
                 breakpoints.size());

  StyleState state;
  std::vector<Element> elements;
  size_t last_pos = 0;
  for (const auto &breakpoint : breakpoints) {
    if (breakpoint.pos > last_pos) {
      elements.push_back(
          styled_run(text.substr(last_pos, breakpoint.pos - last_pos), state));
    }
    if (breakpoint.entity) {
      apply(state, breakpoint);
    }
    last_pos = breakpoint.pos;
  }
  if (last_pos < text.size()) {
    elements.push_back(Element::text(std::string(text.substr(last_pos))));
  }
  return elements;
}

auto parse_message(const std::string &self_id, const tg::Message &message)
    -> satori::MessageObject {
  satori::MessageObject result;
  result.id = std::to_string(message.message_id);
  result.created_at = message.date * 1000;
  auto &elements = result.elements;

  const auto &reply = message.reply_to_message;
  if (reply && !(message.is_topic_message && reply->forum_topic_created)) {
    auto quoted = parse_message(self_id, *reply);
    std::vector<Element> children;
    if (reply->from) {
      auto user = parse_user(self_id, *reply->from);
      children.push_back(
          Element::make("user", {{"id", user.id},
                                 {"name", optional_json(user.name)},
                                 {"nick", optional_json(user.nick)},
                                 {"avatar", optional_json(user.avatar)},
                                 {"is-bot", user.is_bot.value_or(false)}}));
    }
    for (auto &element : quoted.elements) {
      children.push_back(std::move(element));
    }
    elements.push_back(Element::make("quote", {{"id", quoted.id}},
                                     std::move(children)));
  }

  std::string_view body;
  if (message.text) {
    body = *message.text;
  } else if (message.caption) {
    body = *message.caption;
  }
  auto text_elements = parse_text(
      body, message.text ? message.entities : message.caption_entities);
  for (auto &element : text_elements) {
    elements.push_back(std::move(element));
  }

  if (message.caption && !message.caption->empty()) {
    elements.push_back(Element::text(" "));
  }

  if (message.location) {
    elements.push_back(
        Element::make("location", {{"lat", message.location->latitude},
                                   {"lon", message.location->longitude}}));
  } else if (const auto *photo = message.largest_photo()) {
    elements.push_back(Element::make(
        "img", {{"src", make_locator(self_id, photo->file_id)}}));
  } else if (message.sticker) {
    elements.push_back(file_element("img", self_id, *message.sticker, true));
  } else if (message.voice) {
    elements.push_back(file_element("audio", self_id, *message.voice, false));
  } else if (message.animation) {
    elements.push_back(file_element("img", self_id, *message.animation, true));
  } else if (message.video) {
    elements.push_back(file_element("video", self_id, *message.video, true));
  } else if (message.document) {
    elements.push_back(file_element("file", self_id, *message.document, true));
  } else if (message.audio) {
    elements.push_back(file_element("audio", self_id, *message.audio, true));
  }

  return result;
}

} // namespace tgsatori::adapter::telegram
