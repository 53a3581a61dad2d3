#include "network/http_client.hpp"
#include "common/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <optional>
#include <utility>

namespace tgsatori::network {

using tcp = asio::ip::tcp;

namespace {
// 响应体上限，Bot API 允许下载的文件最大为 20MB
constexpr uint64_t kBodyLimit = 64ULL * 1024 * 1024;

template <typename Stream>
auto exchange(Stream &stream, http::request<http::string_body> &request,
              std::chrono::milliseconds timeout)
    -> asio::awaitable<http::response<http::string_body>> {
  beast::get_lowest_layer(stream).expires_after(timeout);
  co_await http::async_write(stream, request, asio::use_awaitable);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kBodyLimit);
  beast::get_lowest_layer(stream).expires_after(timeout);
  co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
  co_return parser.release();
}
} // namespace

struct HttpClient::Impl {
  common::ConnectionConfig config;
  std::optional<ssl::context> ssl_ctx;

  explicit Impl(common::ConnectionConfig cfg) : config(std::move(cfg)) {
    // 如果是HTTPS连接，初始化SSL上下文
    if (config.use_ssl) {
      ssl_ctx.emplace(ssl::context::tlsv12_client);
      if (config.ca_file.empty()) {
        ssl_ctx->set_default_verify_paths();
      } else {
        ssl_ctx->load_verify_file(config.ca_file);
      }
      ssl_ctx->set_verify_mode(ssl::verify_peer);
    }
  }

  auto perform(http::request<http::string_body> request)
      -> asio::awaitable<http::response<http::string_body>> {
    auto executor = co_await asio::this_coro::executor;
    const auto timeout = config.timeout;

    tcp::resolver resolver(executor);
    auto const results = co_await resolver.async_resolve(
        config.host, std::to_string(config.port), asio::use_awaitable);

    if (ssl_ctx) {
      beast::ssl_stream<beast::tcp_stream> stream(executor, *ssl_ctx);
      // SNI
      if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                    config.host.c_str())) {
        throw HttpClientError("Failed to set SNI host name: " + config.host);
      }
      // 证书必须属于所连接的主机
      stream.set_verify_callback(ssl::host_name_verification(config.host));
      beast::get_lowest_layer(stream).expires_after(timeout);
      co_await beast::get_lowest_layer(stream).async_connect(
          results, asio::use_awaitable);
      beast::get_lowest_layer(stream).expires_after(timeout);
      co_await stream.async_handshake(ssl::stream_base::client,
                                      asio::use_awaitable);
      co_return co_await exchange(stream, request, timeout);
    }

    beast::tcp_stream stream(executor);
    stream.expires_after(timeout);
    co_await stream.async_connect(results, asio::use_awaitable);
    co_return co_await exchange(stream, request, timeout);
  }
};

HttpClient::HttpClient(const common::ConnectionConfig &config)
    : pimpl_(std::make_unique<Impl>(config)) {
  TGSATORI_DEBUG("HTTP Client initialized for {}:{}", config.host,
                 config.port);
}

HttpClient::~HttpClient() = default;

void HttpClient::prepare_request(
    http::request<http::string_body> &request,
    const std::map<std::string, std::string> &headers) {
  request.set(http::field::host, pimpl_->config.host);
  request.set(http::field::user_agent, "tgsatori/1.0 " BOOST_BEAST_VERSION_STRING);
  request.set(http::field::accept, "*/*");

  // 设置默认Content-Type (仅当有body时)
  if (!request.body().empty()) {
    request.set(http::field::content_type, "application/json");
  }

  // 添加自定义头部 (会覆盖默认头部)
  for (const auto &[key, value] : headers) {
    request.set(key, value);
  }
  request.prepare_payload();
}

auto HttpClient::execute_sync(http::request<http::string_body> request)
    -> HttpResponse {
  asio::io_context ioc;
  auto future = asio::co_spawn(ioc, pimpl_->perform(std::move(request)),
                               asio::use_future);
  ioc.run();

  HttpResponse response;
  response.raw_response = future.get();
  response.status_code = response.raw_response.result_int();
  response.body = response.raw_response.body();

  TGSATORI_DEBUG("Received response with status code: {} ({} bytes)",
                 response.status_code, response.body.size());
  return response;
}

auto HttpClient::post_sync(std::string_view path, std::string_view body,
                           const std::map<std::string, std::string> &headers)
    -> HttpResponse {
  TGSATORI_DEBUG("POST {} ({} bytes)", pimpl_->config.host, body.size());

  try {
    const std::string target(path);
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.body() = std::string(body);
    prepare_request(req, headers);
    return execute_sync(std::move(req));
  } catch (const std::exception &e) {
    TGSATORI_ERROR("HTTP POST request failed: {}", e.what());
    throw HttpClientError(std::string("HTTP POST request failed: ") +
                          e.what());
  }
}

auto HttpClient::get_sync(std::string_view path,
                          const std::map<std::string, std::string> &headers)
    -> HttpResponse {
  TGSATORI_DEBUG("GET {}", pimpl_->config.host);

  try {
    const std::string target(path);
    http::request<http::string_body> req{http::verb::get, target, 11};
    prepare_request(req, headers);
    return execute_sync(std::move(req));
  } catch (const std::exception &e) {
    TGSATORI_ERROR("HTTP GET request failed: {}", e.what());
    throw HttpClientError(std::string("HTTP GET request failed: ") + e.what());
  }
}

void HttpClient::set_timeout(std::chrono::milliseconds timeout) {
  pimpl_->config.timeout = timeout;
}

auto HttpClient::config() const -> const common::ConnectionConfig & {
  return pimpl_->config;
}

} // namespace tgsatori::network
