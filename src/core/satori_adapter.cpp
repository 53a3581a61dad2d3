#include "core/satori_adapter.hpp"
#include "common/json_utils.hpp"
#include "common/logger.hpp"
#include "telegram/adapter/locator.hpp"
#include "telegram/adapter/message_decoder.hpp"
#include "telegram/adapter/message_encoder.hpp"
#include "telegram/adapter/user_parser.hpp"

#include <charconv>
#include <chrono>

namespace tgsatori::core {

using json = nlohmann::json;
namespace tg = tgsatori::telegram;
namespace tga = tgsatori::adapter::telegram;

namespace {
auto now_ms() -> int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

auto require_id(const json &params, const std::string &key) -> std::string {
  auto value = common::JsonUtils::get_optional_id_as_string(params, key);
  if (!value || value->empty()) {
    throw ApiError("missing parameter: " + key);
  }
  return *value;
}

auto require_string(const json &params, const std::string &key)
    -> std::string {
  auto value = common::JsonUtils::get_optional<std::string>(params, key);
  if (!value) {
    throw ApiError("missing parameter: " + key);
  }
  return *value;
}

auto require_target(const json &params) -> tg::ChatTarget {
  const auto channel_id = require_id(params, "channel_id");
  auto target = tg::ChatTarget::parse(channel_id);
  if (!target) {
    throw ApiError("invalid channel_id: " + channel_id);
  }
  return *target;
}

auto to_int64(const std::string &text, const std::string &key) -> int64_t {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    throw ApiError("invalid " + key + ": " + text);
  }
  return value;
}
} // namespace

SatoriAdapter::SatoriAdapter(network::IBotApi &api,
                             network::IFileFetcher &fetcher,
                             common::AdapterConfig config)
    : api_(api), fetcher_(fetcher), config_(std::move(config)) {
  login_.adapter = std::string(kAdapterName);
  login_.platform = std::string(tga::kPlatform);
}

auto SatoriAdapter::start() -> asio::awaitable<satori::Login> {
  auto me = co_await api_.get_me();
  self_id_ = std::to_string(me.id);

  login_.status = satori::LoginStatus::online;
  login_.user = tga::parse_user(self_id_, me);
  TGSATORI_INFO("已登录 Telegram: {} (@{})", self_id_,
                me.username.value_or(me.first_name));

  emit(make_event("login-updated"));
  co_return login_;
}

void SatoriAdapter::set_event_callback(EventCallback callback) {
  event_callback_ = std::move(callback);
}

auto SatoriAdapter::make_event(std::string type) -> satori::Event {
  satori::Event event;
  event.sn = next_sn_++;
  event.type = std::move(type);
  event.timestamp = now_ms();
  event.login = login_;
  return event;
}

void SatoriAdapter::emit(satori::Event event) {
  if (!event_callback_) {
    TGSATORI_DEBUG("Event callback not set, dropping {}", event.type);
    return;
  }
  event_callback_(event);
}

void SatoriAdapter::handle_message(const json &raw, const std::string &type) {
  auto message = tg::Message::from_json(raw);
  auto event = make_event(type);

  auto thread_id = message.is_topic_message ? message.message_thread_id
                                            : std::nullopt;
  auto [guild, channel] =
      tga::parse_guild_channel(self_id_, message.chat, thread_id);
  event.guild = std::move(guild);
  event.channel = std::move(channel);
  if (message.from) {
    event.user = tga::parse_user(self_id_, *message.from);
  }
  event.message = tga::parse_message(self_id_, message);
  const auto timestamp =
      message.edit_date ? *message.edit_date : message.date;
  if (timestamp > 0) {
    event.timestamp = timestamp * 1000;
  }
  emit(std::move(event));
}

auto SatoriAdapter::handle_callback_query(const json &raw)
    -> asio::awaitable<void> {
  auto query = tg::CallbackQuery::from_json(raw);
  auto event = make_event("interaction/button");
  event.user = tga::parse_user(self_id_, query.from);
  if (query.message) {
    auto thread_id = query.message->is_topic_message
                         ? query.message->message_thread_id
                         : std::nullopt;
    auto [guild, channel] =
        tga::parse_guild_channel(self_id_, query.message->chat, thread_id);
    event.guild = std::move(guild);
    event.channel = std::move(channel);
    event.message = tga::parse_message(self_id_, *query.message);
  }
  event.button = satori::Button{query.data.value_or("")};
  emit(std::move(event));

  co_await api_.answer_callback_query(query.id, std::nullopt);
}

auto SatoriAdapter::handle_update(json update) -> asio::awaitable<void> {
  if (!update.is_object()) {
    TGSATORI_WARN("忽略无效的更新: {}", update.dump());
    co_return;
  }

  // update 中除 update_id 外只有一个字段
  if (update.contains("message")) {
    handle_message(update["message"], "message-created");
  } else if (update.contains("edited_message")) {
    handle_message(update["edited_message"], "message-updated");
  } else if (update.contains("channel_post")) {
    handle_message(update["channel_post"], "message-created");
  } else if (update.contains("edited_channel_post")) {
    handle_message(update["edited_channel_post"], "message-updated");
  } else if (update.contains("callback_query")) {
    co_await handle_callback_query(update["callback_query"]);
  } else {
    TGSATORI_DEBUG("忽略不支持的更新类型: {}", update.dump());
  }
}

auto SatoriAdapter::call(std::string method, json params)
    -> asio::awaitable<json> {
  TGSATORI_DEBUG("Satori API 调用: {}", method);

  if (method == "login.get") {
    co_return login_.to_json();
  }

  if (method == "user.get") {
    const auto user_id = require_id(params, "user_id");
    auto user = co_await api_.get_user(to_int64(user_id, "user_id"));
    co_return tga::parse_user(self_id_, user).to_json();
  }

  if (method == "message.create") {
    auto target = require_target(params);
    auto content = require_string(params, "content");
    auto messages =
        co_await tga::send_message(api_, fetcher_, self_id_, target,
                                   std::move(content), config_.fetch_timeout_s);
    json result = json::array();
    for (const auto &message : messages) {
      result.push_back(message.to_json());
    }
    co_return result;
  }

  if (method == "message.update") {
    auto target = require_target(params);
    const auto message_id = require_id(params, "message_id");
    auto content = require_string(params, "content");
    co_await tga::update_message(api_, target,
                                 to_int64(message_id, "message_id"),
                                 std::move(content));
    co_return json::object();
  }

  throw MethodNotFoundError(method);
}

bool SatoriAdapter::ensure(std::string_view platform,
                           std::string_view self_id) const {
  return platform == tga::kPlatform && !self_id_.empty() &&
         self_id == self_id_;
}

auto SatoriAdapter::fetch_internal(std::string path)
    -> asio::awaitable<std::optional<std::string>> {
  auto locator = tga::parse_locator_path(path);
  if (!locator || locator->platform != tga::kPlatform ||
      locator->account_id != self_id_) {
    co_return std::nullopt;
  }
  auto data = co_await api_.get_file_content(locator->file_id);
  co_return std::optional<std::string>(std::move(data));
}

} // namespace tgsatori::core
