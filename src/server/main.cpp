#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "core/satori_adapter.hpp"
#include "core/satori_server.hpp"
#include "network/file_fetcher.hpp"
#include "telegram/network/connection_manager.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

using namespace tgsatori;
namespace asio = boost::asio;

namespace {

void print_version() {
  std::cout << "tgsatori v1.0.0" << std::endl;
  std::cout << "Telegram adapter for the Satori protocol" << std::endl;
}

void print_help() {
  std::cout << "Usage: tgsatori_server [OPTIONS] [CONFIG_FILE]" << std::endl;
  std::cout << std::endl;
  std::cout << "OPTIONS:" << std::endl;
  std::cout << "  -h, --help     Show this help message" << std::endl;
  std::cout << "  -v, --version  Show version information" << std::endl;
  std::cout << std::endl;
  std::cout << "CONFIG_FILE:" << std::endl;
  std::cout << "  Path to TOML configuration file (default: config.toml)"
            << std::endl;
}

// 协程结束时记录异常，不让单个 update 的失败影响其他 update
void log_exception(const std::exception_ptr &error, const char *what) {
  if (!error) {
    return;
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    TGSATORI_ERROR("{} 失败: {}", what, e.what());
  }
}

} // namespace

auto main(int argc, char *argv[]) -> int {
  common::Logger::initialize(spdlog::level::info);
  std::string config_path = "config.toml";

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      return 0;
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    } else if (arg.starts_with("-")) {
      std::cerr << "Unknown option: " << arg << std::endl;
      print_help();
      return 1;
    } else {
      config_path = arg;
    }
  }

  auto &config_loader = common::ConfigLoader::instance();
  if (!config_loader.load_config(config_path)) {
    std::cerr << "Failed to load configuration from: " << config_path
              << std::endl;
    return 1;
  }

  auto config = config_loader.get_adapter_config();
  if (!config) {
    std::cerr << "Invalid configuration in: " << config_path << std::endl;
    return 1;
  }

  common::Logger::initialize(
      common::Logger::level_from_name(config->log_level), config->log_file);
  TGSATORI_INFO("tgsatori starting...");
  TGSATORI_INFO("Configuration loaded from: {}", config_path);

  try {
    asio::io_context ioc;

    network::TelegramConnectionManager connection(ioc, *config);
    network::FileFetcher fetcher;
    core::SatoriAdapter adapter(connection, fetcher, *config);

    fetcher.set_internal_resolver([&adapter](std::string path) {
      return adapter.fetch_internal(std::move(path));
    });

    core::SatoriServer server(ioc, config->server, adapter);
    adapter.set_event_callback([&server](const satori::Event &event) {
      TGSATORI_DEBUG("Satori 事件: {}", event.to_json().dump());
      server.broadcast(event);
    });

    connection.set_update_callback([&](const nlohmann::json &update) {
      asio::co_spawn(ioc, adapter.handle_update(update),
                     [](const std::exception_ptr &error) {
                       log_exception(error, "处理更新");
                     });
    });

    server.start();
    connection.connect();

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
          auto login = co_await adapter.start();
          TGSATORI_INFO("登录信息: {}", login.to_json().dump());
          connection.start_polling();
        },
        [&](const std::exception_ptr &error) {
          if (error) {
            log_exception(error, "启动");
            ioc.stop();
          }
        });

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int signal) {
      if (ec) {
        return;
      }
      TGSATORI_INFO("Received signal {}, shutting down gracefully...", signal);
      connection.disconnect();
      server.stop();
      ioc.stop();
    });

    ioc.run();
  } catch (const std::exception &e) {
    TGSATORI_ERROR("程序异常: {}", e.what());
    common::Logger::flush();
    return 1;
  }

  TGSATORI_INFO("程序正常退出");
  common::Logger::flush();
  return 0;
}
