#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tgsatori::common {

/**
 * \if CHINESE
 * @brief 连接配置
 * \endif
 * \if ENGLISH
 * @brief Connection configuration
 * \endif
 */
struct ConnectionConfig {
  std::string host = "api.telegram.org";
  uint16_t port = 443;
  std::string access_token;
  std::chrono::milliseconds timeout{30000};
  bool use_ssl = true;
  // 额外信任的 CA 证书文件 (PEM)，为空时使用系统默认证书
  std::string ca_file;
};

/**
 * @brief Satori 服务端配置
 */
struct ServerConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 5140;
  // 路由前缀，例如 "/satori"，为空时挂在根路径
  std::string path;
  // 非空时 HTTP 请求和 IDENTIFY 信令都必须携带该令牌
  std::string token;
};

/**
 * \if CHINESE
 * @brief 适配器配置
 * \endif
 * \if ENGLISH
 * @brief Adapter configuration
 * \endif
 */
struct AdapterConfig {
  ConnectionConfig telegram;
  ServerConfig server;
  // getUpdates long polling timeout
  std::chrono::seconds poll_timeout{30};
  std::chrono::milliseconds poll_interval{1000};
  // used when an attachment element carries no timeout attribute
  int fetch_timeout_s = 30;
  std::string log_level = "info";
  std::string log_file;
};

} // namespace tgsatori::common
