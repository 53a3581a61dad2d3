#include "satori/element.hpp"

#include <unordered_map>

namespace tgsatori::satori {

namespace {
const std::unordered_map<std::string_view, ElementKind> &tag_table() {
  static const std::unordered_map<std::string_view, ElementKind> table = {
      {"text", ElementKind::text},
      {"b", ElementKind::bold},
      {"strong", ElementKind::bold},
      {"i", ElementKind::italic},
      {"em", ElementKind::italic},
      {"u", ElementKind::underline},
      {"ins", ElementKind::underline},
      {"s", ElementKind::strikethrough},
      {"del", ElementKind::strikethrough},
      {"code", ElementKind::code},
      {"code-block", ElementKind::code_block},
      {"spl", ElementKind::spoiler},
      {"a", ElementKind::link},
      {"at", ElementKind::mention},
      {"br", ElementKind::line_break},
      {"p", ElementKind::paragraph},
      {"quote", ElementKind::quote},
      {"img", ElementKind::image},
      {"image", ElementKind::image},
      {"audio", ElementKind::audio},
      {"video", ElementKind::video},
      {"file", ElementKind::file},
      {"figure", ElementKind::figure},
      {"button", ElementKind::button},
      {"button-group", ElementKind::button_group},
      {"message", ElementKind::message},
  };
  return table;
}
} // namespace

auto kind_from_tag(std::string_view tag) -> ElementKind {
  const auto &table = tag_table();
  if (auto it = table.find(tag); it != table.end()) {
    return it->second;
  }
  return ElementKind::custom;
}

auto Element::text(std::string content) -> Element {
  Element element;
  element.kind = ElementKind::text;
  element.tag = "text";
  element.attrs["text"] = std::move(content);
  return element;
}

auto Element::make(std::string tag, json attrs, std::vector<Element> children)
    -> Element {
  Element element;
  element.kind = kind_from_tag(tag);
  element.tag = std::move(tag);
  element.attrs = attrs.is_object() ? std::move(attrs) : json::object();
  element.children = std::move(children);
  return element;
}

auto Element::has_attr(const std::string &key) const -> bool {
  return attrs.is_object() && attrs.contains(key);
}

auto Element::attr(const std::string &key) const
    -> std::optional<std::string> {
  if (!has_attr(key)) {
    return std::nullopt;
  }
  const auto &value = attrs.at(key);
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number()) {
    return value.dump();
  }
  return std::nullopt;
}

auto Element::text_content() const -> std::string {
  if (kind == ElementKind::text) {
    return attr("text").value_or("");
  }
  std::string result;
  for (const auto &child : children) {
    result += child.text_content();
  }
  return result;
}

} // namespace tgsatori::satori
