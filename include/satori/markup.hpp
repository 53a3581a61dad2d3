#pragma once

#include "satori/element.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tgsatori::satori {

/**
 * \if CHINESE
 * @brief 将 Satori 消息编码解析为元素树
 *
 * 解析是宽松的：无法识别的标签语法按原样保留为文本，未匹配的闭合标签被丢弃，
 * 未闭合的元素在输入末尾自动闭合。该函数从不抛出异常。
 * \endif
 * \if ENGLISH
 * @brief Parses Satori message markup into an element tree.
 *
 * Parsing is lenient: malformed tag syntax is kept as literal text,
 * unmatched closing tags are dropped and unclosed elements close at the end
 * of input. Never throws.
 * \endif
 */
auto parse(std::string_view markup) -> std::vector<Element>;

/**
 * \if CHINESE
 * @brief 转义 & < >，inline_attr 为 true 时同时转义双引号
 * \endif
 * \if ENGLISH
 * @brief Escapes & < > and, when inline_attr is set, the double quote.
 * \endif
 */
auto escape(std::string_view text, bool inline_attr = false) -> std::string;

auto unescape(std::string_view text) -> std::string;

/**
 * \if CHINESE
 * @brief 将元素序列化为消息编码；strip 为 true 时仅返回纯文本内容
 * \endif
 * \if ENGLISH
 * @brief Serializes elements to markup. With strip set only the flattened
 * text content is returned.
 * \endif
 */
auto dumps(const Element &element, bool strip = false) -> std::string;
auto dumps(const std::vector<Element> &elements, bool strip = false)
    -> std::string;

} // namespace tgsatori::satori
