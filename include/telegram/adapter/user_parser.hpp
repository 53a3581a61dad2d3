#pragma once

#include "satori/model.hpp"
#include "telegram/types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace tgsatori::adapter::telegram {

namespace tg = tgsatori::telegram;

/**
 * @brief 将 Telegram 用户转换为 Satori 用户
 *
 * name 为 username，nick 为 "first last"（无 last_name 时仅 first），
 * 已知头像时 avatar 为其内部定位符。
 */
auto parse_user(const std::string &self_id, const tg::User &user)
    -> satori::User;

/**
 * @brief 将 Telegram 会话转换为 Satori 群组与频道
 *
 * 私聊没有群组，频道类型为 direct；其他会话的频道 ID 为会话 ID，
 * 话题消息为 "<chat_id>:<thread_id>"。
 */
auto parse_guild_channel(const std::string &self_id, const tg::Chat &chat,
                         std::optional<int64_t> thread_id = std::nullopt)
    -> std::pair<std::optional<satori::Guild>, satori::Channel>;

} // namespace tgsatori::adapter::telegram
