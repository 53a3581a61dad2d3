#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <stdexcept>
#include <string>

namespace tgsatori::network {
namespace asio = boost::asio;

/**
 * @brief 已下载的附件
 */
struct DownloadedFile {
  std::string filename;
  std::string data;
  std::string mime;
};

/**
 * @brief 附件获取失败（无效的 data URI、无法读取的文件、远端返回非 2xx）
 */
class FetchError : public std::runtime_error {
public:
  explicit FetchError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief 附件字节获取接口
 */
class IFileFetcher {
public:
  virtual ~IFileFetcher() = default;

  /**
   * @brief 获取附件内容
   * @param locator data URI、file: URI 或 http(s) URL
   * @param suggested_name 非空时作为文件名
   * @param timeout_s 本次获取的超时（秒）
   */
  virtual asio::awaitable<DownloadedFile> fetch(std::string locator,
                                                std::string suggested_name,
                                                int timeout_s) = 0;
};

} // namespace tgsatori::network
