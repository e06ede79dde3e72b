#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>
#include <tally/common/errors.hpp>
#include <tally/net/http_client.hpp>

namespace tally::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

std::optional<endpoint> try_parse_endpoint(std::string_view url) {
  auto parsed = endpoint{};
  if (url.starts_with("http://")) {
    url.remove_prefix(7);
  } else if (url.starts_with("tcp://")) {
    url.remove_prefix(6);
  } else if (url.find("://") != std::string_view::npos) {
    return std::nullopt;
  }

  auto slash = url.find('/');
  auto authority = url.substr(0, slash);
  if (slash != std::string_view::npos) {
    auto path = url.substr(slash);
    while (path.ends_with('/')) {
      path.remove_suffix(1);
    }
    parsed.base_path = std::string{path};
  }

  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    auto port = authority.substr(colon + 1);
    if (port.empty() ||
        port.find_first_not_of("0123456789") != std::string_view::npos) {
      return std::nullopt;
    }
    parsed.port = std::string{port};
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    return std::nullopt;
  }
  parsed.host = std::string{authority};
  return parsed;
}

http_client::http_client(const std::string_view url,
                         const std::chrono::milliseconds timeout)
    : timeout_{timeout} {
  auto parsed = try_parse_endpoint(url);
  if (!parsed) {
    throw tally::common::transport_error{"unsupported endpoint URL: " +
                                         std::string{url}};
  }
  endpoint_ = std::move(*parsed);
}

std::string http_client::get(const std::string_view target) const {
  return request(false, target, {});
}

std::string http_client::post_json(const std::string_view target,
                                   const std::string_view body) const {
  return request(true, target, body);
}

std::string http_client::request(const bool post,
                                 const std::string_view target,
                                 const std::string_view body) const {
  auto path = endpoint_.base_path + std::string{target};
  if (path.empty()) {
    path = "/";
  }

  try {
    auto context = asio::io_context{};
    auto resolver = tcp::resolver{context};
    auto stream = beast::tcp_stream{context};

    stream.expires_after(timeout_);
    auto results = resolver.resolve(endpoint_.host, endpoint_.port);
    stream.connect(results);

    auto req = http::request<http::string_body>{
        post ? http::verb::post : http::verb::get, path, 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (post) {
      req.set(http::field::content_type, "application/json");
      req.body() = std::string{body};
      req.prepare_payload();
    }

    stream.expires_after(timeout_);
    http::write(stream, req);

    auto buffer = beast::flat_buffer{};
    auto res = http::response<http::string_body>{};
    http::read(stream, buffer, res);

    auto ec = beast::error_code{};
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    auto status = res.result_int();
    if (status < 200 || status >= 300) {
      spdlog::debug("HTTP {} {} returned {}", post ? "POST" : "GET", path,
                    status);
      throw tally::common::transport_error{
          fmt::format("{}:{}{} returned HTTP {}", endpoint_.host,
                      endpoint_.port, path, status)};
    }
    return std::move(res.body());
  } catch (const beast::system_error& e) {
    throw tally::common::transport_error{
        fmt::format("{}:{}{}: {}", endpoint_.host, endpoint_.port, path,
                    e.code().message())};
  }
}

}  // namespace tally::net
