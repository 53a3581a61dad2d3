#include "common/config_loader.hpp"
#include "common/logger.hpp"

namespace tgsatori::common {

namespace {
// "satori/" -> "/satori"，"/" -> ""
auto normalize_route_prefix(std::string path) -> std::string {
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  if (!path.empty() && path.front() != '/') {
    path.insert(path.begin(), '/');
  }
  return path;
}
} // namespace

bool ConfigLoader::load_config(const std::string &config_path) {
  std::lock_guard lock(mutex_);

  try {
    config_path_ = config_path;
    config_data_ = std::make_unique<toml::table>(toml::parse_file(config_path));
    TGSATORI_INFO("Config loaded successfully from: {}", config_path);
    return true;
  } catch (const toml::parse_error &e) {
    TGSATORI_ERROR("Failed to parse config file {}: {}", config_path,
                   e.what());
    config_data_.reset();
    return false;
  } catch (const std::exception &e) {
    TGSATORI_ERROR("Failed to load config file {}: {}", config_path, e.what());
    config_data_.reset();
    return false;
  }
}

bool ConfigLoader::load_config_string(std::string_view content) {
  std::lock_guard lock(mutex_);

  try {
    config_path_.clear();
    config_data_ = std::make_unique<toml::table>(toml::parse(content));
    return true;
  } catch (const toml::parse_error &e) {
    TGSATORI_ERROR("Failed to parse config: {}", e.what());
    config_data_.reset();
    return false;
  }
}

std::optional<AdapterConfig> ConfigLoader::get_adapter_config() const {
  if (!is_loaded()) {
    return std::nullopt;
  }

  auto token = get_value<std::string>("telegram.token");
  if (!token || token->empty()) {
    TGSATORI_ERROR("配置缺少 telegram.token");
    return std::nullopt;
  }

  AdapterConfig config;
  config.telegram.access_token = *token;
  if (auto host = get_value<std::string>("telegram.api_host")) {
    config.telegram.host = *host;
  }
  if (auto port = get_value<int64_t>("telegram.api_port")) {
    config.telegram.port = static_cast<uint16_t>(*port);
  }
  if (auto use_ssl = get_value<bool>("telegram.use_ssl")) {
    config.telegram.use_ssl = *use_ssl;
  }
  if (auto ca_file = get_value<std::string>("telegram.ca_file")) {
    config.telegram.ca_file = *ca_file;
  }
  if (auto timeout = get_value<int64_t>("telegram.timeout_ms")) {
    config.telegram.timeout = std::chrono::milliseconds(*timeout);
  }
  if (auto poll_timeout = get_value<int64_t>("telegram.poll_timeout_s")) {
    config.poll_timeout = std::chrono::seconds(*poll_timeout);
  }
  if (auto poll_interval = get_value<int64_t>("telegram.poll_interval_ms")) {
    config.poll_interval = std::chrono::milliseconds(*poll_interval);
  }
  if (auto host = get_value<std::string>("server.host")) {
    config.server.host = *host;
  }
  if (auto port = get_value<int64_t>("server.port")) {
    config.server.port = static_cast<uint16_t>(*port);
  }
  if (auto path = get_value<std::string>("server.path")) {
    config.server.path = normalize_route_prefix(*path);
  }
  if (auto server_token = get_value<std::string>("server.token")) {
    config.server.token = *server_token;
  }
  if (auto fetch_timeout = get_value<int64_t>("fetch.timeout_s")) {
    config.fetch_timeout_s = static_cast<int>(*fetch_timeout);
  }
  if (auto level = get_value<std::string>("log.level")) {
    config.log_level = *level;
  }
  if (auto file = get_value<std::string>("log.file")) {
    config.log_file = *file;
  }

  return config;
}

std::optional<toml::table> ConfigLoader::get_section(
    const std::string &section_name) const {
  std::lock_guard lock(mutex_);

  if (!config_data_) {
    return std::nullopt;
  }

  if (auto section = config_data_->get(section_name)) {
    if (auto section_table = section->as_table()) {
      return *section_table;
    }
  }

  return std::nullopt;
}

void ConfigLoader::reload_config() {
  std::string path;
  {
    std::lock_guard lock(mutex_);
    path = config_path_;
  }
  if (!path.empty()) {
    load_config(path);
  }
}

} // namespace tgsatori::common
