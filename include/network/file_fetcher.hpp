#pragma once

#include "interfaces/file_fetcher.hpp"

#include <boost/asio/awaitable.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tgsatori::network {

/**
 * \if CHINESE
 * @brief 附件字节获取实现
 *
 * 支持 `data:<mime>;base64,<payload>`、`file:` URI、http(s) URL，
 * 以及设置了解析器时的 `internal:` 定位符。
 * \endif
 * \if ENGLISH
 * @brief Byte fetcher for attachment sources: base64 data URIs, `file:` URIs,
 * http(s) URLs and, when a resolver is installed, `internal:` locators.
 * \endif
 */
class FileFetcher : public IFileFetcher {
public:
  /// 参数为 `internal:` 之后的部分，无法解析时返回 std::nullopt
  using InternalResolver =
      std::function<asio::awaitable<std::optional<std::string>>(std::string)>;

  FileFetcher() = default;

  void set_internal_resolver(InternalResolver resolver);

  asio::awaitable<DownloadedFile> fetch(std::string locator,
                                        std::string suggested_name,
                                        int timeout_s) override;

  /**
   * @brief MIME 对应的扩展名（含点），未知时返回 ".bin"
   */
  static auto extension_for_mime(std::string_view mime) -> std::string;

  /**
   * @brief 根据文件扩展名推断 MIME，未知时返回 application/octet-stream
   */
  static auto mime_for_path(std::string_view path) -> std::string;

  /**
   * @brief 根据文件头推断 MIME
   */
  static auto sniff_mime(std::string_view data) -> std::string;

  static auto decode_data_uri(std::string_view uri, std::string suggested_name)
      -> DownloadedFile;
  static auto read_file_uri(std::string_view uri, std::string suggested_name)
      -> DownloadedFile;

private:
  static auto download(std::string_view url, std::string suggested_name,
                       int timeout_s) -> DownloadedFile;

  InternalResolver internal_resolver_;
};

} // namespace tgsatori::network
