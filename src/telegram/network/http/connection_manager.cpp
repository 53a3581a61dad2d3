#include "telegram/network/connection_manager.hpp"
#include "common/logger.hpp"
#include "common/json_utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <random>

namespace tgsatori::network {

using json = nlohmann::json;

namespace {
auto make_boundary() -> std::string {
  static constexpr char kHex[] = "0123456789abcdef";
  std::random_device device;
  std::mt19937 generator(device());
  std::uniform_int_distribution<int> distribution(0, 15);
  std::string boundary = "----tgsatori";
  for (int i = 0; i < 24; ++i) {
    boundary += kHex[distribution(generator)];
  }
  return boundary;
}

auto single_media_method(InputMedia::Kind kind) -> const char * {
  switch (kind) {
  case InputMedia::Kind::photo:
    return "sendPhoto";
  case InputMedia::Kind::video:
    return "sendVideo";
  case InputMedia::Kind::audio:
    return "sendAudio";
  case InputMedia::Kind::animation:
    return "sendAnimation";
  case InputMedia::Kind::document:
    break;
  }
  return "sendDocument";
}
} // namespace

TelegramConnectionManager::TelegramConnectionManager(
    asio::io_context &ioc, common::AdapterConfig config)
    : ioc_(ioc), config_(std::move(config)),
      poll_timer_(poll_pool_.get_executor()) {
  TGSATORI_INFO("TelegramConnectionManager 已初始化");
}

TelegramConnectionManager::~TelegramConnectionManager() {
  stop_polling();
  poll_pool_.join();
}

void TelegramConnectionManager::connect() {
  http_client_ = std::make_unique<HttpClient>(config_.telegram);

  // 长轮询请求需要比 getUpdates 的 timeout 更长的超时
  auto poll_config = config_.telegram;
  poll_config.timeout += std::chrono::duration_cast<std::chrono::milliseconds>(
      config_.poll_timeout);
  poll_client_ = std::make_unique<HttpClient>(poll_config);

  is_connected_ = true;
  TGSATORI_INFO("Telegram HTTP连接已建立到 {}:{}", config_.telegram.host,
                config_.telegram.port);
}

void TelegramConnectionManager::disconnect() {
  stop_polling();
  is_connected_ = false;
  TGSATORI_INFO("Telegram HTTP连接已断开");
}

auto TelegramConnectionManager::is_connected() const -> bool {
  return is_connected_.load();
}

void TelegramConnectionManager::set_update_callback(UpdateCallback callback) {
  update_callback_ = std::move(callback);
}

auto TelegramConnectionManager::api_path(std::string_view method) const
    -> std::string {
  return "/bot" + config_.telegram.access_token + "/" + std::string(method);
}

auto TelegramConnectionManager::parse_api_response(const HttpResponse &response)
    -> json {
  auto parsed = common::JsonUtils::parse(response.body);
  if (!parsed) {
    throw HttpClientError("Bot API返回了无效的JSON (HTTP " +
                          std::to_string(response.status_code) + ")");
  }
  const json &body = *parsed;

  if (!body.is_object() || !body.value("ok", false)) {
    const int error_code =
        body.is_object() ? body.value("error_code",
                                      static_cast<int>(response.status_code))
                         : static_cast<int>(response.status_code);
    const std::string description =
        body.is_object() ? body.value("description", std::string("unknown"))
                         : std::string("unknown");
    throw TelegramApiError(error_code, description);
  }
  return body.contains("result") ? body["result"] : json();
}

auto TelegramConnectionManager::build_multipart(
    const std::string &boundary,
    const std::map<std::string, std::string> &fields,
    const std::vector<MultipartFile> &files) -> std::string {
  std::string body;
  for (const auto &[name, value] : fields) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body += value;
    body += "\r\n";
  }
  for (const auto &file : files) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + file.field +
            "\"; filename=\"" + file.filename + "\"\r\n";
    body += "Content-Type: " +
            (file.mime.empty() ? std::string("application/octet-stream")
                               : file.mime) +
            "\r\n\r\n";
    body += file.data;
    body += "\r\n";
  }
  body += "--" + boundary + "--\r\n";
  return body;
}

auto TelegramConnectionManager::keyboard_to_json(const InlineKeyboard &keyboard)
    -> json {
  json rows = json::array();
  for (const auto &row : keyboard) {
    if (row.empty()) {
      continue;
    }
    json buttons = json::array();
    for (const auto &button : row) {
      buttons.push_back(button.to_json());
    }
    rows.push_back(std::move(buttons));
  }
  return {{"inline_keyboard", std::move(rows)}};
}

auto TelegramConnectionManager::media_group_payload(
    std::vector<InputMedia> &media)
    -> std::pair<json, std::vector<MultipartFile>> {
  json items = json::array();
  std::vector<MultipartFile> files;
  for (size_t i = 0; i < media.size(); ++i) {
    auto &item = media[i];
    const auto attach = "file" + std::to_string(i);
    json entry = {{"type", to_string(item.kind)},
                  {"media", "attach://" + attach}};
    if (item.caption) {
      entry["caption"] = *item.caption;
      entry["parse_mode"] = "HTML";
    }
    if (item.has_spoiler) {
      entry["has_spoiler"] = true;
    }
    items.push_back(std::move(entry));
    files.push_back({attach, item.filename, item.mime, std::move(item.data)});
  }
  return {std::move(items), std::move(files)};
}

auto TelegramConnectionManager::target_fields(
    const telegram::ChatTarget &target, std::optional<int64_t> reply_to) const
    -> std::map<std::string, std::string> {
  std::map<std::string, std::string> fields;
  fields["chat_id"] = std::to_string(target.chat_id);
  if (target.thread_id) {
    fields["message_thread_id"] = std::to_string(*target.thread_id);
  }
  if (reply_to) {
    fields["reply_parameters"] =
        json{{"message_id", *reply_to}, {"allow_sending_without_reply", true}}
            .dump();
  }
  return fields;
}

auto TelegramConnectionManager::call_api(std::string method, json params)
    -> asio::awaitable<json> {
  if (!http_client_) {
    throw std::runtime_error("HTTP客户端未初始化");
  }

  TGSATORI_DEBUG("调用 Bot API {}", method);
  try {
    HttpResponse response =
        http_client_->post_sync(api_path(method), params.dump());
    co_return parse_api_response(response);
  } catch (const std::exception &e) {
    TGSATORI_ERROR("Telegram API请求 {} 失败: {}", method, e.what());
    throw;
  }
}

auto TelegramConnectionManager::call_multipart(
    std::string method, std::map<std::string, std::string> fields,
    std::vector<MultipartFile> files) -> asio::awaitable<json> {
  if (!http_client_) {
    throw std::runtime_error("HTTP客户端未初始化");
  }

  const auto boundary = make_boundary();
  const auto body = build_multipart(boundary, fields, files);
  TGSATORI_DEBUG("调用 Bot API {} (multipart, {} 个文件, {} bytes)", method,
                 files.size(), body.size());
  try {
    HttpResponse response = http_client_->post_sync(
        api_path(method), body,
        {{"Content-Type", "multipart/form-data; boundary=" + boundary}});
    co_return parse_api_response(response);
  } catch (const std::exception &e) {
    TGSATORI_ERROR("Telegram API请求 {} 失败: {}", method, e.what());
    throw;
  }
}

auto TelegramConnectionManager::get_me() -> asio::awaitable<telegram::User> {
  auto result = co_await call_api("getMe", json::object());
  co_return telegram::User::from_json(result);
}

auto TelegramConnectionManager::get_user(int64_t user_id)
    -> asio::awaitable<telegram::User> {
  // getChat 返回的 ChatFullInfo 带有头像
  json params = {{"chat_id", user_id}};
  auto result = co_await call_api("getChat", std::move(params));
  co_return telegram::User::from_json(result);
}

auto TelegramConnectionManager::send_message(telegram::ChatTarget target,
                                             std::string text,
                                             std::optional<int64_t> reply_to,
                                             InlineKeyboard keyboard)
    -> asio::awaitable<telegram::Message> {
  json params = {{"chat_id", target.chat_id},
                 {"text", std::move(text)},
                 {"parse_mode", "HTML"}};
  if (target.thread_id) {
    params["message_thread_id"] = *target.thread_id;
  }
  if (reply_to) {
    params["reply_parameters"] = {{"message_id", *reply_to},
                                  {"allow_sending_without_reply", true}};
  }
  if (!keyboard.empty()) {
    params["reply_markup"] = keyboard_to_json(keyboard);
  }
  auto result = co_await call_api("sendMessage", std::move(params));
  co_return telegram::Message::from_json(result);
}

auto TelegramConnectionManager::edit_message_text(telegram::ChatTarget target,
                                                  int64_t message_id,
                                                  std::string text,
                                                  InlineKeyboard keyboard)
    -> asio::awaitable<telegram::Message> {
  json params = {{"chat_id", target.chat_id},
                 {"message_id", message_id},
                 {"text", std::move(text)},
                 {"parse_mode", "HTML"}};
  if (!keyboard.empty()) {
    params["reply_markup"] = keyboard_to_json(keyboard);
  }
  auto result = co_await call_api("editMessageText", std::move(params));
  co_return telegram::Message::from_json(result);
}

auto TelegramConnectionManager::send_single_media(
    telegram::ChatTarget target, InputMedia media,
    std::optional<int64_t> reply_to) -> asio::awaitable<telegram::Message> {
  auto fields = target_fields(target, reply_to);
  if (media.caption) {
    fields["caption"] = *media.caption;
    fields["parse_mode"] = "HTML";
  }
  if (media.has_spoiler) {
    fields["has_spoiler"] = "true";
  }
  std::vector<MultipartFile> files;
  files.push_back({to_string(media.kind), media.filename, media.mime,
                   std::move(media.data)});
  auto result = co_await call_multipart(single_media_method(media.kind),
                                        std::move(fields), std::move(files));
  co_return telegram::Message::from_json(result);
}

auto TelegramConnectionManager::send_media_group(
    telegram::ChatTarget target, std::vector<InputMedia> media,
    std::optional<int64_t> reply_to)
    -> asio::awaitable<std::vector<telegram::Message>> {
  std::vector<telegram::Message> messages;
  for (size_t start = 0; start < media.size(); start += kMaxMediaGroupSize) {
    const size_t end = std::min(start + kMaxMediaGroupSize, media.size());
    // sendMediaGroup 至少需要两个媒体
    if (end - start == 1) {
      messages.push_back(
          co_await send_single_media(target, std::move(media[start]), reply_to));
      continue;
    }

    std::vector<InputMedia> chunk(std::make_move_iterator(media.begin() + start),
                                  std::make_move_iterator(media.begin() + end));
    auto [items, files] = media_group_payload(chunk);
    auto fields = target_fields(target, reply_to);
    fields["media"] = items.dump();
    auto result = co_await call_multipart("sendMediaGroup", std::move(fields),
                                          std::move(files));
    for (const auto &message : result) {
      messages.push_back(telegram::Message::from_json(message));
    }
  }
  co_return messages;
}

auto TelegramConnectionManager::send_animation(telegram::ChatTarget target,
                                               InputMedia animation,
                                               std::optional<int64_t> reply_to)
    -> asio::awaitable<telegram::Message> {
  animation.kind = InputMedia::Kind::animation;
  co_return co_await send_single_media(target, std::move(animation), reply_to);
}

auto TelegramConnectionManager::answer_callback_query(
    std::string callback_query_id, std::optional<std::string> text)
    -> asio::awaitable<void> {
  json params = {{"callback_query_id", std::move(callback_query_id)}};
  if (text) {
    params["text"] = *text;
  }
  co_await call_api("answerCallbackQuery", std::move(params));
}

auto TelegramConnectionManager::get_file_content(std::string file_id)
    -> asio::awaitable<std::string> {
  json params = {{"file_id", file_id}};
  auto result = co_await call_api("getFile", std::move(params));
  if (!result.is_object() || !result.contains("file_path")) {
    throw std::runtime_error("getFile响应中没有file_path字段");
  }

  const auto file_path = result["file_path"].get<std::string>();
  HttpResponse response = http_client_->get_sync(
      "/file/bot" + config_.telegram.access_token + "/" + file_path);
  if (!response.is_success()) {
    throw HttpClientError("文件下载失败，状态码: " +
                          std::to_string(response.status_code));
  }
  co_return std::move(response.body);
}

void TelegramConnectionManager::start_polling() {
  if (is_polling_.exchange(true) == false) {
    // 启动轮询协程
    asio::co_spawn(poll_pool_, poll_updates(), asio::detached);
    TGSATORI_INFO("开始Telegram更新轮询，长轮询超时: {}s",
                  config_.poll_timeout.count());
  }
}

void TelegramConnectionManager::stop_polling() {
  if (is_polling_.exchange(false)) {
    asio::post(poll_timer_.get_executor(), [this]() { poll_timer_.cancel(); });
    TGSATORI_INFO("停止Telegram更新轮询");
  }
}

auto TelegramConnectionManager::poll_updates() -> asio::awaitable<void> {
  while (is_polling_) {
    bool failed = false;
    try {
      if (!poll_client_) {
        break;
      }

      json params = {{"offset", update_offset_},
                     {"limit", 100},
                     {"timeout", config_.poll_timeout.count()},
                     {"allowed_updates",
                      json::array({"message", "edited_message", "channel_post",
                                   "edited_channel_post",
                                   "callback_query"})}};
      HttpResponse response =
          poll_client_->post_sync(api_path("getUpdates"), params.dump());
      process_updates(parse_api_response(response));
    } catch (const std::exception &e) {
      TGSATORI_WARN("更新轮询失败: {}", e.what());
      failed = true;
    }

    if (!failed || !is_polling_) {
      continue;
    }

    // 失败后等待再重试
    poll_timer_.expires_after(config_.poll_interval);
    try {
      co_await poll_timer_.async_wait(asio::use_awaitable);
    } catch (const boost::system::system_error &e) {
      if (e.code() == asio::error::operation_aborted) {
        break; // 轮询被取消
      }
      throw;
    }
  }

  TGSATORI_DEBUG("Telegram更新轮询协程已退出");
}

void TelegramConnectionManager::process_updates(const json &updates) {
  if (!updates.is_array()) {
    TGSATORI_DEBUG("getUpdates result is not an array");
    return;
  }
  TGSATORI_DEBUG("Processing {} updates from Telegram", updates.size());

  for (const auto &update : updates) {
    if (update.contains("update_id")) {
      update_offset_ =
          std::max(update_offset_, update["update_id"].get<int64_t>() + 1);
    }
    if (update_callback_) {
      asio::post(ioc_, [callback = update_callback_, update]() {
        callback(update);
      });
    }
  }
}

} // namespace tgsatori::network
