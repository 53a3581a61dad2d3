#include "satori/markup.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>

namespace tgsatori::satori {

namespace {

struct Tag {
  bool closing = false;
  bool self_closing = false;
  std::string name;
  json attrs = json::object();
  size_t end = 0;
};

auto is_space(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

auto is_name_char(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
         c == ':' || c == '.';
}

void append_utf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// 解析 &#N; 或 &#xH; 形式的数字实体
auto decode_numeric_entity(std::string_view body) -> std::optional<uint32_t> {
  int base = 10;
  if (!body.empty() && (body.front() == 'x' || body.front() == 'X')) {
    base = 16;
    body.remove_prefix(1);
  }
  if (body.empty()) {
    return std::nullopt;
  }
  uint32_t cp = 0;
  auto [ptr, ec] =
      std::from_chars(body.data(), body.data() + body.size(), cp, base);
  if (ec != std::errc() || ptr != body.data() + body.size() || cp > 0x10FFFF) {
    return std::nullopt;
  }
  return cp;
}

auto read_tag(std::string_view input, size_t pos) -> std::optional<Tag> {
  const size_t n = input.size();
  Tag tag;
  size_t i = pos + 1;
  if (i < n && input[i] == '/') {
    tag.closing = true;
    ++i;
  }

  const size_t name_start = i;
  while (i < n && is_name_char(input[i])) {
    ++i;
  }
  if (i == name_start ||
      !std::isalpha(static_cast<unsigned char>(input[name_start]))) {
    return std::nullopt;
  }
  tag.name = std::string(input.substr(name_start, i - name_start));

  while (true) {
    while (i < n && is_space(input[i])) {
      ++i;
    }
    if (i >= n) {
      return std::nullopt;
    }
    if (input[i] == '>') {
      tag.end = i + 1;
      return tag;
    }
    if (input[i] == '/') {
      if (i + 1 < n && input[i + 1] == '>') {
        tag.self_closing = true;
        tag.end = i + 2;
        return tag;
      }
      return std::nullopt;
    }
    if (tag.closing) {
      return std::nullopt;
    }

    const size_t key_start = i;
    while (i < n && !is_space(input[i]) && input[i] != '=' &&
           input[i] != '>' && input[i] != '/' && input[i] != '<' &&
           input[i] != '"' && input[i] != '\'') {
      ++i;
    }
    if (i == key_start) {
      return std::nullopt;
    }
    std::string key(input.substr(key_start, i - key_start));

    if (i < n && input[i] == '=') {
      ++i;
      if (i >= n) {
        return std::nullopt;
      }
      const char quote = input[i];
      if (quote == '"' || quote == '\'') {
        const auto close = input.find(quote, i + 1);
        if (close == std::string_view::npos) {
          return std::nullopt;
        }
        tag.attrs[key] = unescape(input.substr(i + 1, close - i - 1));
        i = close + 1;
      } else {
        const size_t value_start = i;
        while (i < n && !is_space(input[i]) && input[i] != '>') {
          if (input[i] == '/' && i + 1 < n && input[i + 1] == '>') {
            break;
          }
          ++i;
        }
        tag.attrs[key] = unescape(input.substr(value_start, i - value_start));
      }
    } else {
      tag.attrs[key] = true;
    }
  }
}

void dump_attrs(std::string &out, const json &attrs) {
  if (!attrs.is_object()) {
    return;
  }
  for (const auto &[key, value] : attrs.items()) {
    if (value.is_null() || (value.is_boolean() && !value.get<bool>())) {
      continue;
    }
    out += ' ';
    out += key;
    if (value.is_boolean()) {
      continue;
    }
    out += "=\"";
    if (value.is_string()) {
      out += escape(value.get<std::string>(), true);
    } else {
      out += escape(value.dump(), true);
    }
    out += '"';
  }
}

} // namespace

auto escape(std::string_view text, bool inline_attr) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '"':
      result += inline_attr ? "&quot;" : "\"";
      break;
    default:
      result += c;
    }
  }
  return result;
}

auto unescape(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      result += text[i++];
      continue;
    }
    const auto semi = text.find(';', i + 1);
    if (semi == std::string_view::npos || semi - i > 10) {
      result += text[i++];
      continue;
    }
    const auto body = text.substr(i + 1, semi - i - 1);
    if (body == "amp") {
      result += '&';
    } else if (body == "lt") {
      result += '<';
    } else if (body == "gt") {
      result += '>';
    } else if (body == "quot") {
      result += '"';
    } else if (body == "apos") {
      result += '\'';
    } else if (!body.empty() && body.front() == '#') {
      auto cp = decode_numeric_entity(body.substr(1));
      if (!cp) {
        result += text[i++];
        continue;
      }
      append_utf8(result, *cp);
    } else {
      result += text[i++];
      continue;
    }
    i = semi + 1;
  }
  return result;
}

auto parse(std::string_view markup) -> std::vector<Element> {
  std::vector<Element> root;
  std::vector<Element> stack;
  std::string pending;

  auto current = [&]() -> std::vector<Element> & {
    return stack.empty() ? root : stack.back().children;
  };
  auto flush_text = [&]() {
    if (!pending.empty()) {
      current().push_back(Element::text(unescape(pending)));
      pending.clear();
    }
  };
  auto close_top = [&]() {
    Element element = std::move(stack.back());
    stack.pop_back();
    current().push_back(std::move(element));
  };

  size_t pos = 0;
  while (pos < markup.size()) {
    const auto lt = markup.find('<', pos);
    if (lt == std::string_view::npos) {
      pending.append(markup.substr(pos));
      break;
    }
    pending.append(markup.substr(pos, lt - pos));

    if (markup.substr(lt, 4) == "<!--") {
      const auto end = markup.find("-->", lt + 4);
      pos = end == std::string_view::npos ? markup.size() : end + 3;
      continue;
    }

    auto tag = read_tag(markup, lt);
    if (!tag) {
      pending.push_back('<');
      pos = lt + 1;
      continue;
    }

    flush_text();
    pos = tag->end;

    if (tag->closing) {
      for (size_t i = stack.size(); i > 0; --i) {
        if (stack[i - 1].tag == tag->name) {
          while (stack.size() >= i) {
            close_top();
          }
          break;
        }
      }
      continue;
    }

    auto element = Element::make(std::move(tag->name), std::move(tag->attrs));
    if (tag->self_closing) {
      current().push_back(std::move(element));
    } else {
      stack.push_back(std::move(element));
    }
  }

  flush_text();
  while (!stack.empty()) {
    close_top();
  }
  return root;
}

auto dumps(const Element &element, bool strip) -> std::string {
  if (element.is_text()) {
    auto text = element.attr("text").value_or("");
    return strip ? text : escape(text);
  }
  if (strip) {
    return dumps(element.children, true);
  }

  std::string result = "<" + element.tag;
  dump_attrs(result, element.attrs);
  if (element.children.empty()) {
    result += "/>";
    return result;
  }
  result += '>';
  result += dumps(element.children, false);
  result += "</" + element.tag + ">";
  return result;
}

auto dumps(const std::vector<Element> &elements, bool strip) -> std::string {
  std::string result;
  for (const auto &element : elements) {
    result += dumps(element, strip);
  }
  return result;
}

} // namespace tgsatori::satori
