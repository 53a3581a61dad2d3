#include "network/file_fetcher.hpp"
#include "common/logger.hpp"
#include "network/http_client.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_map>

namespace tgsatori::network {

namespace {

constexpr std::string_view kOctetStream = "application/octet-stream";
// 与常见 HTTP 客户端一致的重定向上限
constexpr int kMaxRedirects = 10;

const std::unordered_map<std::string_view, std::string_view> &
extension_table() {
  static const std::unordered_map<std::string_view, std::string_view> table = {
      {".png", "image/png"},        {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},      {".gif", "image/gif"},
      {".webp", "image/webp"},      {".bmp", "image/bmp"},
      {".mp4", "video/mp4"},        {".webm", "video/webm"},
      {".mov", "video/quicktime"},  {".mp3", "audio/mpeg"},
      {".ogg", "audio/ogg"},        {".oga", "audio/ogg"},
      {".wav", "audio/x-wav"},      {".m4a", "audio/mp4"},
      {".flac", "audio/flac"},      {".pdf", "application/pdf"},
      {".zip", "application/zip"},  {".txt", "text/plain"},
      {".json", "application/json"}};
  return table;
}

const std::unordered_map<std::string_view, std::string_view> &mime_table() {
  static const std::unordered_map<std::string_view, std::string_view> table = {
      {"image/png", ".png"},        {"image/jpeg", ".jpg"},
      {"image/gif", ".gif"},        {"image/webp", ".webp"},
      {"image/bmp", ".bmp"},        {"video/mp4", ".mp4"},
      {"video/webm", ".webm"},      {"video/quicktime", ".mov"},
      {"audio/mpeg", ".mp3"},       {"audio/ogg", ".ogg"},
      {"audio/x-wav", ".wav"},      {"audio/wav", ".wav"},
      {"audio/mp4", ".m4a"},        {"audio/flac", ".flac"},
      {"application/pdf", ".pdf"},  {"application/zip", ".zip"},
      {"text/plain", ".txt"},       {"application/json", ".json"}};
  return table;
}

auto to_lower(std::string_view text) -> std::string {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

auto percent_decode(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      unsigned int value = 0;
      auto [ptr, ec] =
          std::from_chars(text.data() + i + 1, text.data() + i + 3, value, 16);
      if (ec == std::errc() && ptr == text.data() + i + 3) {
        result.push_back(static_cast<char>(value));
        i += 2;
        continue;
      }
    }
    result.push_back(text[i]);
  }
  return result;
}

auto base64_decode(std::string_view input) -> std::optional<std::string> {
  std::string cleaned;
  cleaned.reserve(input.size());
  for (char c : input) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      cleaned.push_back(c);
    }
  }
  if (cleaned.empty()) {
    return std::string();
  }
  while (cleaned.size() % 4 != 0) {
    cleaned.push_back('=');
  }

  std::string output(cleaned.size() / 4 * 3, '\0');
  const int length = EVP_DecodeBlock(
      reinterpret_cast<unsigned char *>(output.data()),
      reinterpret_cast<const unsigned char *>(cleaned.data()),
      static_cast<int>(cleaned.size()));
  if (length < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock 不会去掉填充产生的零字节
  size_t padding = 0;
  for (auto it = cleaned.rbegin(); it != cleaned.rend() && *it == '=' &&
                                    padding < 2;
       ++it) {
    ++padding;
  }
  output.resize(static_cast<size_t>(length) - padding);
  return output;
}

struct Url {
  bool https = false;
  std::string host;
  uint16_t port = 80;
  std::string target;
  std::string path;
};

auto parse_url(std::string_view url) -> std::optional<Url> {
  Url result;
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    return std::nullopt;
  }
  const auto scheme = to_lower(url.substr(0, scheme_end));
  if (scheme == "https") {
    result.https = true;
    result.port = 443;
  } else if (scheme != "http") {
    return std::nullopt;
  }

  auto rest = url.substr(scheme_end + 3);
  const auto path_start = rest.find_first_of("/?#");
  auto authority = rest.substr(0, path_start);
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }
  // IPv6 字面量写作 [addr]:port
  std::string_view host = authority;
  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    host = authority.substr(1, close - 1);
    auto rest_of_authority = authority.substr(close + 1);
    if (!rest_of_authority.empty()) {
      if (rest_of_authority.front() != ':') {
        return std::nullopt;
      }
      port_text = rest_of_authority.substr(1);
    }
  } else if (const auto colon = authority.rfind(':');
             colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port_text = authority.substr(colon + 1);
  }
  if (!port_text.empty()) {
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(),
                                     port_text.data() + port_text.size(), port);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size()) {
      return std::nullopt;
    }
    result.port = port;
  }
  if (host.empty()) {
    return std::nullopt;
  }
  result.host = std::string(host);

  std::string target = path_start == std::string_view::npos
                           ? "/"
                           : std::string(rest.substr(path_start));
  if (const auto hash = target.find('#'); hash != std::string::npos) {
    target.resize(hash);
  }
  if (target.empty() || target.front() != '/') {
    target.insert(target.begin(), '/');
  }
  result.target = target;
  result.path = target.substr(0, target.find('?'));
  return result;
}

auto is_redirect(unsigned int status) -> bool {
  return status == 301 || status == 302 || status == 303 || status == 307 ||
         status == 308;
}

// 将 Location 头解析为绝对 URL
auto resolve_location(const Url &base, std::string_view location)
    -> std::string {
  const std::string scheme = base.https ? "https:" : "http:";
  if (location.find("://") != std::string_view::npos) {
    return std::string(location);
  }
  if (location.substr(0, 2) == "//") {
    return scheme + std::string(location);
  }
  const auto host = base.host.find(':') == std::string::npos
                        ? base.host
                        : "[" + base.host + "]";
  auto origin = scheme + "//" + host + ":" + std::to_string(base.port);
  if (!location.empty() && location.front() == '/') {
    return origin + std::string(location);
  }
  return origin + base.path.substr(0, base.path.rfind('/') + 1) +
         std::string(location);
}

} // namespace

void FileFetcher::set_internal_resolver(InternalResolver resolver) {
  internal_resolver_ = std::move(resolver);
}

auto FileFetcher::extension_for_mime(std::string_view mime) -> std::string {
  const auto &table = mime_table();
  if (auto it = table.find(to_lower(mime)); it != table.end()) {
    return std::string(it->second);
  }
  return ".bin";
}

auto FileFetcher::mime_for_path(std::string_view path) -> std::string {
  const auto extension =
      to_lower(std::filesystem::path(std::string(path)).extension().string());
  const auto &table = extension_table();
  if (auto it = table.find(extension); it != table.end()) {
    return std::string(it->second);
  }
  return std::string(kOctetStream);
}

auto FileFetcher::sniff_mime(std::string_view data) -> std::string {
  auto starts_with = [&](std::string_view magic) {
    return data.substr(0, magic.size()) == magic;
  };
  if (starts_with("GIF87a") || starts_with("GIF89a")) {
    return "image/gif";
  }
  if (starts_with("\x89PNG\r\n\x1a\n")) {
    return "image/png";
  }
  if (starts_with("\xFF\xD8\xFF")) {
    return "image/jpeg";
  }
  if (data.size() >= 12 && starts_with("RIFF") &&
      data.substr(8, 4) == "WEBP") {
    return "image/webp";
  }
  if (starts_with("OggS")) {
    return "audio/ogg";
  }
  if (data.size() >= 8 && data.substr(4, 4) == "ftyp") {
    return "video/mp4";
  }
  if (starts_with("%PDF")) {
    return "application/pdf";
  }
  return std::string(kOctetStream);
}

auto FileFetcher::decode_data_uri(std::string_view uri,
                                  std::string suggested_name)
    -> DownloadedFile {
  constexpr std::string_view marker = ";base64,";
  const auto header_end = uri.find(marker);
  if (uri.substr(0, 5) != "data:" || header_end == std::string_view::npos) {
    throw FetchError("unsupported data URI");
  }
  const auto mime = uri.substr(5, header_end - 5);
  const bool valid_mime =
      !mime.empty() && std::all_of(mime.begin(), mime.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
               c == '/' || c == '.' || c == '+' || c == '-';
      });
  if (!valid_mime) {
    throw FetchError("invalid MIME type in data URI");
  }

  auto data = base64_decode(uri.substr(header_end + marker.size()));
  if (!data) {
    throw FetchError("invalid base64 payload in data URI");
  }

  DownloadedFile file;
  file.mime = std::string(mime);
  file.data = std::move(*data);
  file.filename = suggested_name.empty()
                      ? "file" + extension_for_mime(file.mime)
                      : std::move(suggested_name);
  return file;
}

auto FileFetcher::read_file_uri(std::string_view uri,
                                std::string suggested_name) -> DownloadedFile {
  auto rest = uri.substr(5);
  // file:///path 或 file://localhost/path
  if (rest.substr(0, 2) == "//") {
    rest.remove_prefix(2);
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
      throw FetchError("invalid file URI: " + std::string(uri));
    }
    const auto host = rest.substr(0, slash);
    if (!host.empty() && host != "localhost") {
      throw FetchError("file URI with remote host is not supported: " +
                       std::string(uri));
    }
    rest.remove_prefix(slash);
  }
  const std::filesystem::path path(percent_decode(rest));

  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw FetchError("cannot open file: " + path.string());
  }
  std::string data((std::istreambuf_iterator<char>(stream)),
                   std::istreambuf_iterator<char>());
  if (stream.bad()) {
    throw FetchError("failed to read file: " + path.string());
  }

  DownloadedFile file;
  file.data = std::move(data);
  file.mime = mime_for_path(path.string());
  file.filename = suggested_name.empty() ? path.filename().string()
                                         : std::move(suggested_name);
  return file;
}

auto FileFetcher::download(std::string_view url, std::string suggested_name,
                           int timeout_s) -> DownloadedFile {
  std::string current(url);
  for (int redirects = 0;; ++redirects) {
    auto parsed = parse_url(current);
    if (!parsed) {
      throw FetchError("invalid URL: " + current);
    }

    common::ConnectionConfig config;
    config.host = parsed->host;
    config.port = parsed->port;
    config.use_ssl = parsed->https;
    config.timeout = std::chrono::seconds(timeout_s);

    HttpClient client(config);
    HttpResponse response;
    try {
      response = client.get_sync(parsed->target);
    } catch (const HttpClientError &e) {
      throw FetchError(e.what());
    }

    if (is_redirect(response.status_code)) {
      const auto location = response.header(http::field::location);
      if (location.empty()) {
        throw FetchError("redirect without Location from " + current);
      }
      if (redirects >= kMaxRedirects) {
        throw FetchError("too many redirects while downloading " +
                         std::string(url));
      }
      auto next = resolve_location(*parsed, trim(location));
      TGSATORI_DEBUG("HTTP {} redirect: {} -> {}", response.status_code,
                     current, next);
      current = std::move(next);
      continue;
    }
    if (!response.is_success()) {
      throw FetchError("download of " + current + " failed with HTTP " +
                       std::to_string(response.status_code));
    }

    DownloadedFile file;
    auto content_type = response.header(http::field::content_type);
    auto mime = trim(std::string_view(content_type)
                         .substr(0, content_type.find_first_of(";,")));
    file.mime = mime.empty() ? std::string(kOctetStream) : to_lower(mime);
    file.data = std::move(response.body);

    if (!suggested_name.empty()) {
      file.filename = std::move(suggested_name);
    } else {
      // 文件名取自最终 URL
      const auto &path = parsed->path;
      file.filename = percent_decode(path.substr(path.rfind('/') + 1));
      if (file.filename.empty()) {
        file.filename = "file" + extension_for_mime(file.mime);
      }
    }
    return file;
  }
}

auto FileFetcher::fetch(std::string locator, std::string suggested_name,
                        int timeout_s) -> asio::awaitable<DownloadedFile> {
  TGSATORI_DEBUG("fetching attachment ({} chars, timeout {}s)", locator.size(),
                 timeout_s);

  if (locator.rfind("data:", 0) == 0) {
    co_return decode_data_uri(locator, std::move(suggested_name));
  }
  if (locator.rfind("file:", 0) == 0) {
    co_return read_file_uri(locator, std::move(suggested_name));
  }
  if (locator.rfind("internal:", 0) == 0) {
    if (!internal_resolver_) {
      throw FetchError("internal locators are not available: " + locator);
    }
    const auto path = locator.substr(9);
    auto data = co_await internal_resolver_(path);
    if (!data) {
      throw FetchError("cannot resolve internal locator: " + locator);
    }
    DownloadedFile file;
    file.mime = sniff_mime(*data);
    file.data = std::move(*data);
    file.filename = suggested_name.empty()
                        ? path.substr(path.rfind('/') + 1) +
                              extension_for_mime(file.mime)
                        : std::move(suggested_name);
    co_return file;
  }

  const auto scheme = to_lower(locator.substr(0, locator.find(':')));
  if (scheme == "http" || scheme == "https") {
    co_return download(locator, std::move(suggested_name), timeout_s);
  }
  throw FetchError("unsupported attachment source: " + locator);
}

} // namespace tgsatori::network
