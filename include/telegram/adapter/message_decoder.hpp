#pragma once

#include "satori/element.hpp"
#include "satori/model.hpp"
#include "telegram/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tgsatori::adapter::telegram {

namespace tg = tgsatori::telegram;

/**
 * \if CHINESE
 * @brief 将 UTF-16 偏移映射为 UTF-8 字节位置
 *
 * 落在代理对中间的偏移映射到下一个字符边界，超出末尾的偏移映射到文本末尾。
 * \endif
 * \if ENGLISH
 * @brief Maps UTF-16 code unit offsets (as used by Telegram entities) onto
 * UTF-8 byte positions of the same text.
 *
 * An offset inside a surrogate pair maps to the next code point boundary; an
 * offset past the end maps to the end of the text.
 * \endif
 */
class Utf16Index {
public:
  explicit Utf16Index(std::string_view text);

  auto to_byte(int64_t utf16_offset) const -> size_t;

private:
  std::vector<size_t> byte_of_unit_;
  size_t size_ = 0;
};

/**
 * \if CHINESE
 * @brief 通过扫描格式断点，将带实体的文本转换为元素序列
 * \endif
 * \if ENGLISH
 * @brief Converts entity-annotated text into an element sequence by sweeping
 * over the format change breakpoints.
 *
 * Breakpoints are ordered by position; at equal positions entity breakpoints
 * (in entity order, each start before its end) come before the synthetic
 * breakpoints of literal line breaks. Every run is wrapped in the fixed order
 * bold, italic, underline, strikethrough, code, pre, spoiler, mention, link,
 * user reference. A mention replaces the inner chain with a fresh `at`
 * element and a run consisting of a single `\n` becomes a bare `br`.
 * \endif
 */
auto parse_text(std::string_view text,
                const std::vector<tg::MessageEntity> &entities)
    -> std::vector<satori::Element>;

/**
 * \if CHINESE
 * @brief 将一条 Telegram 消息（含回复链）解码为 Satori 消息
 * \endif
 * \if ENGLISH
 * @brief Decodes one Telegram message, including its reply chain, into a
 * Satori message whose id is the Telegram message id.
 * \endif
 */
auto parse_message(const std::string &self_id, const tg::Message &message)
    -> satori::MessageObject;

} // namespace tgsatori::adapter::telegram
