#pragma once

#include <memory>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

/*
 * \if CHINESE
 * 如果启用调试追溯，则包含 fmt 相关的头文件
 * \endif
 * \if ENGLISH
 * Include fmt-related headers if debug tracing is enabled
 * \endif
 */
#ifdef TGSATORI_DEBUG_TRACE
#include <fmt/color.h>
#include <fmt/format.h>
#endif

namespace tgsatori::common {

/**
 * \if CHINESE
 * @brief 日志管理器，提供统一的日志接口
 * \endif
 * \if ENGLISH
 * @brief Logger manager, providing a unified logging interface.
 * \endif
 */
class Logger {
public:
  /**
   * \if CHINESE
   * @brief 初始化日志系统
   * @param level 日志级别
   * @param log_file 日志文件路径 (可选)
   * \endif
   * \if ENGLISH
   * @brief Initializes the logging system.
   * @param level The logging level.
   * @param log_file The path to the log file (optional).
   * \endif
   */
  static void initialize(spdlog::level::level_enum level = spdlog::level::info,
                         const std::string &log_file = "");

  /**
   * \if CHINESE
   * @brief 获取默认日志器
   * \endif
   * \if ENGLISH
   * @brief Gets the default logger.
   * \endif
   */
  static auto get() -> std::shared_ptr<spdlog::logger>;

  /**
   * \if CHINESE
   * @brief 获取指定名称的日志器
   * \endif
   * \if ENGLISH
   * @brief Gets a logger with a specific name.
   * \endif
   */
  static auto get(const std::string &name) -> std::shared_ptr<spdlog::logger>;

  /**
   * \if CHINESE
   * @brief 设置日志级别
   * \endif
   * \if ENGLISH
   * @brief Sets the logging level.
   * \endif
   */
  static void set_level(spdlog::level::level_enum level);

  /**
   * \if CHINESE
   * @brief 将配置中的级别名称 ("trace", "debug", "info", ...) 转换为日志级别，
   * 未知名称返回 info
   * \endif
   * \if ENGLISH
   * @brief Maps a level name from the config ("trace", "debug", "info", ...)
   * to a logging level; unknown names map to info.
   * \endif
   */
  static auto level_from_name(std::string_view name)
      -> spdlog::level::level_enum;

  /**
   * \if CHINESE
   * @brief 刷新所有日志器
   * \endif
   * \if ENGLISH
   * @brief Flushes all loggers.
   * \endif
   */
  static void flush();

private:
  static std::shared_ptr<spdlog::logger> default_logger_;
  static bool initialized_;
};

/*
 * \if CHINESE
 * 便利宏定义
 * \endif
 * \if ENGLISH
 * Convenience macro definitions
 * \endif
 */
#ifdef TGSATORI_DEBUG_TRACE
#define TGSATORI_LOG_IMPL(__level, __fmt_str, ...)                             \
  do {                                                                         \
    if (tgsatori::common::Logger::get()->should_log(spdlog::level::__level)) { \
      tgsatori::common::Logger::get()->log(                                    \
          spdlog::level::__level,                                              \
          fmt::format("{} " __fmt_str,                                         \
                      fmt::styled(fmt::format("[{}:{}]", __FILE__, __LINE__),  \
                                  fmt::fg(fmt::color::dark_orange)),           \
                      ##__VA_ARGS__));                                         \
    }                                                                          \
  } while (false)

#define TGSATORI_TRACE(__fmt, ...) TGSATORI_LOG_IMPL(trace, __fmt, ##__VA_ARGS__)
#define TGSATORI_DEBUG(__fmt, ...) TGSATORI_LOG_IMPL(debug, __fmt, ##__VA_ARGS__)
#define TGSATORI_INFO(__fmt, ...) TGSATORI_LOG_IMPL(info, __fmt, ##__VA_ARGS__)
#define TGSATORI_WARN(__fmt, ...) TGSATORI_LOG_IMPL(warn, __fmt, ##__VA_ARGS__)
#define TGSATORI_ERROR(__fmt, ...) TGSATORI_LOG_IMPL(err, __fmt, ##__VA_ARGS__)
#define TGSATORI_CRITICAL(__fmt, ...)                                          \
  TGSATORI_LOG_IMPL(critical, __fmt, ##__VA_ARGS__)
#else
#define TGSATORI_TRACE(...) tgsatori::common::Logger::get()->trace(__VA_ARGS__)
#define TGSATORI_DEBUG(...) tgsatori::common::Logger::get()->debug(__VA_ARGS__)
#define TGSATORI_INFO(...) tgsatori::common::Logger::get()->info(__VA_ARGS__)
#define TGSATORI_WARN(...) tgsatori::common::Logger::get()->warn(__VA_ARGS__)
#define TGSATORI_ERROR(...) tgsatori::common::Logger::get()->error(__VA_ARGS__)
#define TGSATORI_CRITICAL(...)                                                 \
  tgsatori::common::Logger::get()->critical(__VA_ARGS__)
#endif

} // namespace tgsatori::common
