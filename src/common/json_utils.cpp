#include "common/json_utils.hpp"
#include "common/logger.hpp"

namespace tgsatori::common {

auto JsonUtils::parse(const std::string &str) -> std::optional<json> {
  try {
    return json::parse(str);
  } catch (const json::exception &e) {
    TGSATORI_ERROR("Failed to parse JSON: {}", e.what());
    return std::nullopt;
  }
}

auto JsonUtils::get_optional_id_as_string(const json &j, const std::string &key)
    -> std::optional<std::string> {
  if (j.is_object() && j.contains(key)) {
    const auto &value = j.at(key);
    if (value.is_string()) {
      return value.get<std::string>();
    }
    if (value.is_number_integer()) {
      return std::to_string(value.get<long long>());
    }
  }
  return std::nullopt;
}

} // namespace tgsatori::common
