#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tally::net {

/// Endpoint pieces of an `http://host[:port][/base]` or `tcp://host:port` URL.
struct endpoint final {
  std::string host;
  std::string port{"80"};
  std::string base_path;
};

std::optional<endpoint> try_parse_endpoint(std::string_view url);

/// Blocking HTTP/1.1 client, one connection per request.
///
/// Every failure (resolution, connect, timeout, non-2xx status) is reported as
/// tally::common::transport_error.
class http_client final {
 public:
  /// Throws transport_error when `url` cannot be parsed.
  explicit http_client(std::string_view url,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds{10000});

  /// GET `target` relative to the base path; returns the response body.
  std::string get(std::string_view target) const;

  /// POST a JSON `body` to `target`; returns the response body.
  std::string post_json(std::string_view target, std::string_view body) const;

  const endpoint& remote() const { return endpoint_; }

 private:
  std::string request(bool post,
                      std::string_view target,
                      std::string_view body) const;

  endpoint endpoint_;
  std::chrono::milliseconds timeout_;
};

}  // namespace tally::net
