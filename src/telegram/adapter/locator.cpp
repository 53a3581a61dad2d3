#include "telegram/adapter/locator.hpp"

namespace tgsatori::adapter::telegram {

auto make_locator(std::string_view self_id, std::string_view file_id)
    -> std::string {
  std::string locator(kInternalScheme);
  locator += kPlatform;
  locator += '/';
  locator += self_id;
  locator += '/';
  locator += file_id;
  return locator;
}

auto parse_locator(std::string_view locator) -> std::optional<Locator> {
  if (locator.substr(0, kInternalScheme.size()) != kInternalScheme) {
    return std::nullopt;
  }
  return parse_locator_path(locator.substr(kInternalScheme.size()));
}

auto parse_locator_path(std::string_view path) -> std::optional<Locator> {
  const auto first = path.find('/');
  if (first == std::string_view::npos || first == 0) {
    return std::nullopt;
  }
  const auto second = path.find('/', first + 1);
  if (second == std::string_view::npos || second == first + 1 ||
      second + 1 >= path.size()) {
    return std::nullopt;
  }
  Locator result;
  result.platform = std::string(path.substr(0, first));
  result.account_id = std::string(path.substr(first + 1, second - first - 1));
  result.file_id = std::string(path.substr(second + 1));
  return result;
}

} // namespace tgsatori::adapter::telegram
