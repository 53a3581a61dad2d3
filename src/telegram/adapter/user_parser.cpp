#include "telegram/adapter/user_parser.hpp"
#include "telegram/adapter/locator.hpp"

namespace tgsatori::adapter::telegram {

auto parse_user(const std::string &self_id, const tg::User &user)
    -> satori::User {
  satori::User result;
  result.id = std::to_string(user.id);
  result.name = user.username;
  result.nick = user.last_name ? user.first_name + " " + *user.last_name
                               : user.first_name;
  if (user.big_photo_file_id) {
    result.avatar = make_locator(self_id, *user.big_photo_file_id);
  }
  result.is_bot = user.is_bot;
  return result;
}

auto parse_guild_channel(const std::string &self_id, const tg::Chat &chat,
                         std::optional<int64_t> thread_id)
    -> std::pair<std::optional<satori::Guild>, satori::Channel> {
  if (chat.is_private()) {
    satori::Channel channel;
    channel.id = std::to_string(chat.id);
    channel.type = satori::ChannelType::direct;
    return {std::nullopt, channel};
  }

  satori::Guild guild;
  guild.id = std::to_string(chat.id);
  guild.name = chat.title;
  if (chat.big_photo_file_id) {
    guild.avatar = make_locator(self_id, *chat.big_photo_file_id);
  }

  satori::Channel channel;
  channel.id = tg::ChatTarget{chat.id, thread_id}.to_channel_id();
  channel.type = satori::ChannelType::text;
  channel.name = chat.title;
  return {guild, channel};
}

} // namespace tgsatori::adapter::telegram
