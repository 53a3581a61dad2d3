#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tgsatori::satori {

using json = nlohmann::json;

/**
 * \if CHINESE
 * @brief Satori 消息元素种类
 * \endif
 * \if ENGLISH
 * @brief Kinds of Satori message elements. Unknown tags map to custom.
 * \endif
 */
enum class ElementKind {
  text,
  bold,
  italic,
  underline,
  strikethrough,
  code,
  code_block,
  spoiler,
  link,
  mention,
  line_break,
  paragraph,
  quote,
  image,
  audio,
  video,
  file,
  figure,
  button,
  button_group,
  message,
  custom
};

/**
 * \if CHINESE
 * @brief 元素违反约定时抛出（例如缺少 href 的链接）
 * \endif
 * \if ENGLISH
 * @brief Thrown when an element violates its contract, e.g. a link without
 * href or a button without its required attribute.
 * \endif
 */
class ElementError : public std::runtime_error {
public:
  explicit ElementError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * \if CHINESE
 * @brief Satori 元素节点
 * \endif
 * \if ENGLISH
 * @brief A Satori element node.
 *
 * `tag` keeps the name the element was created with (`b` and `strong` are
 * both ElementKind::bold). Text elements store their content in
 * `attrs["text"]`.
 * \endif
 */
struct Element {
  ElementKind kind = ElementKind::custom;
  std::string tag;
  json attrs = json::object();
  std::vector<Element> children;

  static auto text(std::string content) -> Element;
  static auto make(std::string tag, json attrs = json::object(),
                   std::vector<Element> children = {}) -> Element;

  auto is_text() const -> bool { return kind == ElementKind::text; }

  auto has_attr(const std::string &key) const -> bool;

  /**
   * @brief 以字符串形式读取属性，数值会被格式化，布尔值和 null 视为缺失
   */
  auto attr(const std::string &key) const -> std::optional<std::string>;

  auto text_content() const -> std::string;
};

auto kind_from_tag(std::string_view tag) -> ElementKind;

} // namespace tgsatori::satori
