#include "common/logger.hpp"

#include <spdlog/async.h>
#include <stdexcept>
#include <vector>

namespace tgsatori::common {

std::shared_ptr<spdlog::logger> Logger::default_logger_ = nullptr;
bool Logger::initialized_ = false;

void Logger::initialize(spdlog::level::level_enum level,
                        const std::string &log_file) {
  if (initialized_) {
    // 读取配置后会以新的级别和文件重新初始化
    spdlog::drop("tgsatori");
    default_logger_.reset();
    initialized_ = false;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    /*
     * \if CHINESE
     * 控制台输出
     * \endif
     * \if ENGLISH
     * Console output
     * \endif
     */
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    sinks.push_back(console_sink);

    /*
     * \if CHINESE
     * 文件输出 (10MB, 5个文件)
     * \endif
     * \if ENGLISH
     * File output (10MB, 5 files)
     * \endif
     */
    if (!log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 5);
      file_sink->set_level(level);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    }

    default_logger_ = std::make_shared<spdlog::logger>("tgsatori", sinks.begin(),
                                                       sinks.end());
    default_logger_->set_level(level);
    default_logger_->flush_on(spdlog::level::warn);

    /*
     * \if CHINESE
     * 注册为默认日志器
     * \endif
     * \if ENGLISH
     * Register as default logger
     * \endif
     */
    spdlog::register_logger(default_logger_);
    spdlog::set_default_logger(default_logger_);

    initialized_ = true;

    TGSATORI_INFO("Logger initialized successfully");
  } catch (const spdlog::spdlog_ex &ex) {
    throw std::runtime_error("Logger initialization failed: " +
                             std::string(ex.what()));
  }
}

auto Logger::get() -> std::shared_ptr<spdlog::logger> {
  if (!initialized_) {
    initialize();
  }
  return default_logger_;
}

auto Logger::get(const std::string &name) -> std::shared_ptr<spdlog::logger> {
  if (!initialized_) {
    initialize();
  }

  auto logger = spdlog::get(name);
  if (!logger) {
    /*
     * \if CHINESE
     * 创建新的日志器，使用与默认日志器相同的配置
     * \endif
     * \if ENGLISH
     * Create a new logger with the same configuration as the default logger
     * \endif
     */
    logger = default_logger_->clone(name);
    spdlog::register_logger(logger);
  }
  return logger;
}

void Logger::set_level(spdlog::level::level_enum level) {
  if (default_logger_) {
    default_logger_->set_level(level);
    for (const auto &sink : default_logger_->sinks()) {
      sink->set_level(level);
    }
    spdlog::set_level(level);
  }
}

auto Logger::level_from_name(std::string_view name)
    -> spdlog::level::level_enum {
  auto level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

void Logger::flush() {
  if (default_logger_) {
    default_logger_->flush();
  }
  spdlog::apply_all(
      [](const std::shared_ptr<spdlog::logger> &l) { l->flush(); });
}

} // namespace tgsatori::common
