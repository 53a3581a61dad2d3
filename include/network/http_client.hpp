#pragma once

#include "common/config_types.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tgsatori::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;

/**
 * @brief HTTP响应结果
 */
struct HttpResponse {
  unsigned int status_code = 0;
  std::string body;
  http::response<http::string_body> raw_response;

  bool is_success() const { return status_code >= 200 && status_code < 300; }

  /**
   * @brief 读取响应头，不存在时返回空字符串
   */
  std::string header(http::field field) const {
    auto value = raw_response[field];
    return std::string(value.data(), value.size());
  }
};

/**
 * @brief HTTP客户端错误类型
 */
class HttpClientError : public std::runtime_error {
public:
  explicit HttpClientError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief 同步HTTP客户端
 *
 * 基于Boost.Beast，支持HTTP和HTTPS。每个请求在独立的 io_context 中执行，
 * 因此超时对连接、握手、读写全程生效。
 */
class HttpClient {
public:
  /**
   * @brief 构造函数
   * @param config 连接配置（host、port、use_ssl、timeout）
   */
  explicit HttpClient(const common::ConnectionConfig &config);

  virtual ~HttpClient();

  /**
   * @brief 同步发送POST请求
   * @param path 请求路径
   * @param body 请求体
   * @param headers 额外的请求头（会覆盖默认的 Content-Type）
   * @return HTTP响应
   * @throws HttpClientError 连接或读写失败
   */
  virtual HttpResponse post_sync(
      std::string_view path, std::string_view body,
      const std::map<std::string, std::string> &headers = {});

  /**
   * @brief 同步发送GET请求
   * @param path 请求路径
   * @param headers 额外的请求头
   * @return HTTP响应
   * @throws HttpClientError 连接或读写失败
   */
  virtual HttpResponse get_sync(
      std::string_view path,
      const std::map<std::string, std::string> &headers = {});

  /**
   * @brief 设置请求超时
   * @param timeout 超时时间
   */
  void set_timeout(std::chrono::milliseconds timeout);

  const common::ConnectionConfig &config() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;

  /**
   * @brief 同步执行HTTP请求的内部实现
   */
  HttpResponse execute_sync(http::request<http::string_body> request);

  /**
   * @brief 准备请求头
   */
  void prepare_request(http::request<http::string_body> &request,
                       const std::map<std::string, std::string> &headers);
};

} // namespace tgsatori::network
