#pragma once
#include "lfsync/blob_store.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lfsync::http {

struct Url {
  bool tls;
  std::string host;
  std::string port;
  std::string target; // path + query, always starts with '/'

  // Accepts "https://host[:port]/path?query" and "http://...". Throws
  // std::invalid_argument for anything else.
  static auto parse(std::string_view url) -> Url;
};

using Headers = std::vector<std::pair<std::string, std::string>>;

struct Response {
  int status{0};
  std::string body;     // bounded; empty when streamed to a file
  std::string location; // redirect target, if any

  [[nodiscard]] auto ok() const noexcept -> bool { return status >= 200 && status < 300; }
  [[nodiscard]] auto redirect() const noexcept -> bool {
    return status >= 300 && status < 400 && !location.empty();
  }
};

/**
 * Blocking HTTP/1.1 client (Boost.Beast over Asio, TLS via OpenSSL).
 *
 * Each call opens its own connection, so one Client may be shared by
 * concurrent workers. Transport failures (DNS, connect, TLS, timeouts,
 * truncated bodies) throw StoreError with status 0; HTTP error statuses are
 * returned in the Response for the caller to classify.
 */
class Client {
public:
  explicit Client(std::chrono::seconds timeout = std::chrono::seconds(300));
  ~Client();

  Client(const Client &) = delete;
  auto operator=(const Client &) -> Client & = delete;

  // Request with an in-memory body (may be empty).
  auto send(std::string_view method, const std::string &url, const Headers &headers,
            std::string body = {}) -> Response;

  // POST/PUT the contents of `file` as the request body, streamed.
  auto send_file(std::string_view method, const std::string &url, const Headers &headers,
                 const std::filesystem::path &file, const TransferProgress &progress = {})
      -> Response;

  // GET `url`, following up to `max_redirects` redirects, streaming a 2xx body
  // into `dest`. Headers named in `origin_only` (e.g. Authorization) are not
  // forwarded once a redirect leaves the original host.
  auto download(const std::string &url, const Headers &headers, const std::filesystem::path &dest,
                const TransferProgress &progress = {}, int max_redirects = 5,
                const std::vector<std::string> &origin_only = {"Authorization"}) -> Response;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// RFC 3986 percent-encoding of everything but unreserved characters.
auto percent_encode(std::string_view s) -> std::string;

} // namespace lfsync::http
