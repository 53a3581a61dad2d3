#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tgsatori::common {

using json = nlohmann::json;

/**
 * \~chinese
 * @brief JSON工具类，提供读取 Telegram Bot API 负载的便利方法
 *
 * \~english
 * @brief JSON utilities for reading Telegram Bot API payloads.
 */
namespace JsonUtils {
/**
 * \~chinese
 * @brief 安全地从JSON中获取值
 * @tparam T 值类型
 * @param j JSON对象
 * @param key 键名
 * @param default_value 默认值
 * @return 获取的值或默认值
 *
 * \~english
 * @brief Safely gets a value from a JSON object.
 * @tparam T The value type.
 * @param j The JSON object.
 * @param key The key name.
 * @param default_value The default value.
 * @return The retrieved value or the default value.
 */
template <typename T>
auto get_value(const json &j, const std::string &key,
               const T &default_value = T{}) -> T {
  if (j.is_object() && j.contains(key) && !j[key].is_null()) {
    try {
      return j[key].get<T>();
    } catch (const json::exception &) {
      return default_value;
    }
  }
  return default_value;
}

/**
 * \~chinese
 * @brief 安全地从JSON中获取可选值
 * @tparam T 值类型
 * @param j JSON对象
 * @param key 键名
 * @return std::optional包装的值
 *
 * \~english
 * @brief Safely gets an optional value from a JSON object.
 * @tparam T The value type.
 * @param j The JSON object.
 * @param key The key name.
 * @return An std::optional-wrapped value.
 */
template <typename T>
std::optional<T> get_optional(const json &j, const std::string &key) {
  if (j.is_object() && j.contains(key) && !j[key].is_null()) {
    try {
      return j[key].get<T>();
    } catch (const json::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

/**
 * \~chinese
 * @brief 从JSON中安全地获取一个可选的ID字段，该ID可能是字符串或数字。
 *
 * \~english
 * @brief Safely gets an optional ID field from JSON, which could be a string or
 * a number.
 */
auto get_optional_id_as_string(const json &j, const std::string &key)
    -> std::optional<std::string>;

/**
 * \~chinese
 * @brief 安全地解析JSON字符串
 * @param str JSON字符串
 * @return 解析结果的可选值
 *
 * \~english
 * @brief Safely parses a JSON string.
 * @param str The JSON string.
 * @return An optional containing the parsed result.
 */
std::optional<json> parse(const std::string &str);
} // namespace JsonUtils

} // namespace tgsatori::common
