#include "telegram/adapter/message_encoder.hpp"
#include "common/logger.hpp"
#include "satori/markup.hpp"
#include "telegram/adapter/message_decoder.hpp"

#include <algorithm>
#include <charconv>

namespace tgsatori::adapter::telegram {

using satori::Element;
using satori::ElementError;
using satori::ElementKind;

namespace {
auto parse_int(std::string_view text) -> std::optional<int64_t> {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

auto require_attr(const Element &element, const std::string &key)
    -> std::string {
  auto value = element.attr(key);
  if (!value) {
    throw ElementError("<" + element.tag + "> element requires attribute \"" +
                       key + "\"");
  }
  return *value;
}

// 以换行结尾时补成空行，已有空行时不再追加
void separate_paragraph(std::string &content) {
  if (content.empty() || content.back() != '\n') {
    return;
  }
  if (content.size() >= 2 && content[content.size() - 2] == '\n') {
    return;
  }
  content += '\n';
}

// spoiler 属性存在且不为 false
auto is_spoiler(const Element &element) -> bool {
  if (!element.has_attr("spoiler")) {
    return false;
  }
  const auto &value = element.attrs.at("spoiler");
  return !(value.is_boolean() && !value.get<bool>()) && !value.is_null();
}
} // namespace

auto EncoderAccumulator::has_buttons() const -> bool {
  return std::any_of(rows.begin(), rows.end(),
                     [](const auto &row) { return !row.empty(); });
}

auto EncoderAccumulator::keyboard() const -> network::InlineKeyboard {
  network::InlineKeyboard result;
  for (const auto &row : rows) {
    if (!row.empty()) {
      result.push_back(row);
    }
  }
  return result;
}

void EncoderAccumulator::reset() {
  pending_reply_target.reset();
  content.clear();
  rows.clear();
  pending_assets.clear();
}

auto MessageEncoder::render(const std::vector<Element> &elements)
    -> asio::awaitable<void> {
  for (const auto &element : elements) {
    co_await visit(element);
  }
}

auto MessageEncoder::wrap(const Element &element, std::string open,
                          std::string close) -> asio::awaitable<void> {
  acc_.content += open;
  co_await render(element.children);
  acc_.content += close;
}

void MessageEncoder::add_button(const Element &element) {
  network::InlineButton button;
  button.text = satori::dumps(element.children, true);

  const auto type = element.attr("type").value_or("");
  if (type == "link") {
    button.action = network::InlineButton::Action::url;
    button.value = require_attr(element, "href");
  } else if (type == "input") {
    button.action = network::InlineButton::Action::query;
    button.value = require_attr(element, "text");
  } else {
    button.action = network::InlineButton::Action::callback;
    button.value = require_attr(element, "id");
  }

  if (acc_.rows.empty()) {
    acc_.rows.emplace_back();
  }
  if (acc_.rows.back().size() >= kMaxButtonsPerRow) {
    acc_.rows.emplace_back();
  }
  acc_.rows.back().push_back(std::move(button));
}

auto MessageEncoder::visit(const Element &element) -> asio::awaitable<void> {
  switch (element.kind) {
  case ElementKind::text:
    acc_.content += satori::escape(element.attr("text").value_or(""));
    break;
  case ElementKind::line_break:
    acc_.content += "\n";
    break;
  case ElementKind::paragraph:
    separate_paragraph(acc_.content);
    co_await render(element.children);
    separate_paragraph(acc_.content);
    break;
  case ElementKind::bold:
    co_await wrap(element, "<b>", "</b>");
    break;
  case ElementKind::italic:
    co_await wrap(element, "<i>", "</i>");
    break;
  case ElementKind::underline:
    co_await wrap(element, "<u>", "</u>");
    break;
  case ElementKind::strikethrough:
    co_await wrap(element, "<s>", "</s>");
    break;
  case ElementKind::link: {
    auto href = require_attr(element, "href");
    co_await wrap(element, "<a href=\"" + satori::escape(href, true) + "\">",
                  "</a>");
    break;
  }
  case ElementKind::spoiler:
    co_await wrap(element, "<tg-spoiler>", "</tg-spoiler>");
    break;
  case ElementKind::code:
    if (auto content = element.attr("content")) {
      acc_.content += "<code>" + satori::escape(*content) + "</code>";
    } else {
      co_await wrap(element, "<code>", "</code>");
    }
    break;
  case ElementKind::code_block: {
    std::string open = "<pre><code";
    if (auto lang = element.attr("lang")) {
      open += " class=\"language-" + satori::escape(*lang, true) + "\"";
    }
    open += ">";
    co_await wrap(element, std::move(open), "</code></pre>");
    break;
  }
  case ElementKind::mention:
    if (auto id = element.attr("id")) {
      const auto name = element.attr("name").value_or(*id);
      acc_.content += "<a href=\"tg://user?id=" + satori::escape(*id, true) +
                      "\">@" + satori::escape(name) + "</a>";
    }
    break;
  case ElementKind::image:
  case ElementKind::audio:
  case ElementKind::video:
  case ElementKind::file:
    acc_.pending_assets.push_back(element);
    break;
  case ElementKind::figure:
    co_await flush();
    acc_.mode = EncoderAccumulator::Mode::figure;
    co_await render(element.children);
    co_await flush();
    acc_.mode = EncoderAccumulator::Mode::normal;
    break;
  case ElementKind::quote:
    if (auto id = element.attr("id")) {
      auto message_id = parse_int(*id);
      if (!message_id) {
        throw ElementError("<quote> id is not a message id: " + *id);
      }
      co_await flush();
      acc_.pending_reply_target = *message_id;
    } else {
      co_await wrap(element, "<blockquote>", "</blockquote>");
    }
    break;
  case ElementKind::button:
    add_button(element);
    break;
  case ElementKind::button_group:
    acc_.rows.emplace_back();
    co_await render(element.children);
    acc_.rows.emplace_back();
    break;
  case ElementKind::message:
    if (acc_.mode == EncoderAccumulator::Mode::figure) {
      co_await render(element.children);
      acc_.content += "\n";
    } else {
      co_await flush();
      co_await render(element.children);
      co_await flush();
    }
    break;
  case ElementKind::custom:
    co_await render(element.children);
    break;
  }
}

SendMessageEncoder::SendMessageEncoder(network::IBotApi &api,
                                       network::IFileFetcher &fetcher,
                                       std::string self_id,
                                       tg::ChatTarget target,
                                       int default_timeout_s)
    : api_(api), fetcher_(fetcher), self_id_(std::move(self_id)),
      target_(target), default_timeout_s_(default_timeout_s) {}

void SendMessageEncoder::add_result(const tg::Message &message) {
  results_.push_back(parse_message(self_id_, message));
}

auto SendMessageEncoder::flush() -> asio::awaitable<void> {
  if (acc_.empty()) {
    co_return;
  }
  if (!acc_.rows.empty() && acc_.rows.back().empty()) {
    acc_.rows.pop_back();
  }

  try {
    co_await deliver();
  } catch (const ElementError &) {
    throw;
  } catch (const std::exception &e) {
    TGSATORI_ERROR("发送消息到 {} 失败: {} (已发送 {} 条)",
                   target_.to_channel_id(), e.what(), results_.size());
    throw DeliveryError(e.what(), results_);
  }
  acc_.reset();
}

auto SendMessageEncoder::deliver() -> asio::awaitable<void> {
  if (acc_.pending_assets.empty()) {
    TGSATORI_DEBUG("flush: text message to {}, {} keyboard rows",
                   target_.to_channel_id(), acc_.keyboard().size());
    auto message = co_await api_.send_message(
        target_, acc_.content, acc_.pending_reply_target, acc_.keyboard());
    add_result(message);
    co_return;
  }

  std::vector<network::InputMedia> animations;
  std::vector<network::InputMedia> grouped;
  for (size_t i = 0; i < acc_.pending_assets.size(); ++i) {
    const auto &element = acc_.pending_assets[i];
    auto locator = element.attr("src");
    if (!locator) {
      locator = require_attr(element, "url");
    }
    int timeout_s = default_timeout_s_;
    if (auto timeout = parse_int(element.attr("timeout").value_or(""));
        timeout && *timeout > 0) {
      timeout_s = static_cast<int>(*timeout);
    }

    auto file = co_await fetcher_.fetch(
        *locator, element.attr("title").value_or(""), timeout_s);

    network::InputMedia media;
    media.filename = std::to_string(i) + file.filename;
    media.data = std::move(file.data);
    media.mime = std::move(file.mime);

    if (media.mime == "image/gif") {
      media.kind = network::InputMedia::Kind::animation;
      media.has_spoiler = is_spoiler(element);
      animations.push_back(std::move(media));
      continue;
    }
    switch (element.kind) {
    case ElementKind::image:
      media.kind = network::InputMedia::Kind::photo;
      media.has_spoiler = is_spoiler(element);
      break;
    case ElementKind::audio:
      media.kind = network::InputMedia::Kind::audio;
      break;
    case ElementKind::video:
      media.kind = network::InputMedia::Kind::video;
      media.has_spoiler = is_spoiler(element);
      break;
    default:
      media.kind = network::InputMedia::Kind::document;
      break;
    }
    grouped.push_back(std::move(media));
  }

  const bool has_buttons = acc_.has_buttons();
  TGSATORI_DEBUG("flush: {} grouped, {} animations, buttons: {}",
                 grouped.size(), animations.size(), has_buttons);

  if (!has_buttons && !acc_.content.empty()) {
    if (!grouped.empty()) {
      grouped.front().caption = acc_.content;
    } else {
      animations.front().caption = acc_.content;
    }
  }

  std::optional<int64_t> first_grouped;
  std::optional<int64_t> first_produced;
  if (!grouped.empty()) {
    auto messages = co_await api_.send_media_group(
        target_, std::move(grouped), acc_.pending_reply_target);
    for (const auto &message : messages) {
      if (!first_grouped) {
        first_grouped = message.message_id;
      }
      add_result(message);
    }
    first_produced = first_grouped;
  }

  for (auto &animation : animations) {
    auto reply_to = first_grouped ? first_grouped : acc_.pending_reply_target;
    auto message =
        co_await api_.send_animation(target_, std::move(animation), reply_to);
    if (!first_produced) {
      first_produced = message.message_id;
    }
    add_result(message);
  }

  if (has_buttons) {
    auto reply_to = first_produced ? first_produced : acc_.pending_reply_target;
    auto message = co_await api_.send_message(target_, acc_.content, reply_to,
                                              acc_.keyboard());
    add_result(message);
  }
}

auto UpdateMessageEncoder::flush() -> asio::awaitable<void> {
  if (acc_.empty()) {
    co_return;
  }
  if (!acc_.pending_assets.empty()) {
    throw EncodeError("editing a message does not support attachments");
  }
  if (unit_) {
    throw EncodeError(
        "content requires more than one message and cannot be used to edit");
  }
  unit_ = Unit{acc_.content, acc_.keyboard()};
  acc_.reset();
}

auto send_message(network::IBotApi &api, network::IFileFetcher &fetcher,
                  std::string self_id, tg::ChatTarget target,
                  std::string markup, int default_timeout_s)
    -> asio::awaitable<std::vector<satori::MessageObject>> {
  auto elements = satori::parse(markup);
  SendMessageEncoder encoder(api, fetcher, std::move(self_id), target,
                             default_timeout_s);
  co_await encoder.render(elements);
  co_await encoder.flush();
  TGSATORI_DEBUG("send_message to {}: {} message(s) produced",
                 target.to_channel_id(), encoder.results().size());
  co_return encoder.results();
}

auto update_message(network::IBotApi &api, tg::ChatTarget target,
                    int64_t message_id, std::string markup)
    -> asio::awaitable<void> {
  auto elements = satori::parse(markup);
  UpdateMessageEncoder encoder;
  co_await encoder.render(elements);
  co_await encoder.flush();
  if (!encoder.unit()) {
    throw EncodeError("nothing to edit: content is empty");
  }
  auto unit = *encoder.unit();
  co_await api.edit_message_text(target, message_id, std::move(unit.content),
                                 std::move(unit.keyboard));
}

} // namespace tgsatori::adapter::telegram
