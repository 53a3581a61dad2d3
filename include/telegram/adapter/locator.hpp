#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tgsatori::adapter::telegram {

inline constexpr std::string_view kPlatform = "telegram";
inline constexpr std::string_view kInternalScheme = "internal:";

/**
 * @brief 内部附件定位符 `internal:<platform>/<account_id>/<file_id>`
 */
struct Locator {
  std::string platform;
  std::string account_id;
  std::string file_id;
};

auto make_locator(std::string_view self_id, std::string_view file_id)
    -> std::string;

/**
 * @brief 解析完整定位符（含 `internal:` 前缀）
 */
auto parse_locator(std::string_view locator) -> std::optional<Locator>;

/**
 * @brief 解析去掉 `internal:` 前缀后的路径部分
 */
auto parse_locator_path(std::string_view path) -> std::optional<Locator>;

} // namespace tgsatori::adapter::telegram
