#include "lfsync/http.hpp"

#include "lfsync/error.hpp"
#include "lfsync/fs.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace lfsync::http {

namespace {

constexpr std::size_t kChunk = 64 * 1024;
constexpr std::size_t kMaxBufferedBody = 8 * 1024 * 1024;

// Completion handler recording the outcome of one asynchronous operation.
struct Completion {
  beast::error_code &ec;
  std::size_t &bytes;

  void operator()(beast::error_code e) const { ec = e; }
  void operator()(beast::error_code e, std::size_t n) const {
    ec = e;
    bytes = n;
  }
  void operator()(beast::error_code e, const tcp::endpoint &) const { ec = e; }
};

// Drive a single asynchronous operation to completion. Deadlines set on the
// underlying beast::tcp_stream surface as beast::error::timeout.
template <class Initiate>
auto run_op(net::io_context &ioc, Initiate &&initiate, beast::error_code &ec) -> std::size_t {
  std::size_t bytes = 0;
  ec = {};
  initiate(Completion{ec, bytes});
  ioc.restart();
  ioc.run();
  return bytes;
}

template <class Initiate> auto run_op(net::io_context &ioc, Initiate &&initiate) -> std::size_t {
  beast::error_code ec;
  const auto n = run_op(ioc, std::forward<Initiate>(initiate), ec);
  if (ec)
    throw beast::system_error(ec);
  return n;
}

std::string host_header(const Url &u) {
  const bool default_port = (u.tls && u.port == "443") || (!u.tls && u.port == "80");
  return default_port ? u.host : u.host + ":" + u.port;
}

template <class Body>
void prepare(bhttp::request<Body> &req, std::string_view method, const Url &u,
             const Headers &headers) {
  req.version(11);
  req.method_string(beast::string_view(method.data(), method.size()));
  req.target(u.target);
  req.set(bhttp::field::host, host_header(u));
  for (const auto &[name, value] : headers)
    req.set(name, value);
}

// Write the request and read the response. A 2xx body goes to `sink_path`
// when given; anything else is buffered (bounded) into Response::body.
template <class Stream, class Body>
Response converse(net::io_context &ioc, Stream &stream, std::chrono::seconds timeout,
                  bhttp::request<Body> &req, const std::filesystem::path *sink_path,
                  const TransferProgress &upload_progress,
                  const TransferProgress &download_progress) {
  auto &lowest = beast::get_lowest_layer(stream);

  bhttp::request_serializer<Body> sr{req};
  const std::uintmax_t up_total = req.payload_size().value_or(0);
  std::uintmax_t sent = 0;
  while (!sr.is_done()) {
    lowest.expires_after(timeout);
    sent += run_op(ioc, [&](auto handler) { bhttp::async_write_some(stream, sr, handler); });
    if (upload_progress && up_total > 0)
      upload_progress(std::min(sent, up_total), up_total);
  }

  beast::flat_buffer buffer;
  bhttp::response_parser<bhttp::buffer_body> parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
  lowest.expires_after(timeout);
  run_op(ioc, [&](auto handler) { bhttp::async_read_header(stream, buffer, parser, handler); });

  Response out;
  out.status = static_cast<int>(parser.get().result_int());
  if (const auto it = parser.get().find(bhttp::field::location); it != parser.get().end())
    out.location = std::string(it->value());

  std::ofstream sink;
  const bool to_sink = sink_path != nullptr && out.ok();
  if (to_sink) {
    fs::ensure_parent_dir(*sink_path);
    sink.open(*sink_path, std::ios::binary | std::ios::trunc);
    if (!sink)
      throw std::runtime_error("open for write failed: " + sink_path->string());
  }

  const std::uintmax_t down_total = parser.content_length().value_or(0);
  std::uintmax_t received = 0;
  std::vector<char> chunk(kChunk);
  while (!parser.is_done()) {
    parser.get().body().data = chunk.data();
    parser.get().body().size = chunk.size();
    lowest.expires_after(timeout);
    beast::error_code ec;
    run_op(ioc, [&](auto handler) { bhttp::async_read(stream, buffer, parser, handler); }, ec);
    if (ec && ec != bhttp::error::need_buffer)
      throw beast::system_error(ec);
    const std::size_t n = chunk.size() - parser.get().body().size;
    if (n == 0)
      continue;
    if (to_sink) {
      sink.write(chunk.data(), static_cast<std::streamsize>(n));
      if (!sink)
        throw std::runtime_error("write failed: " + sink_path->string());
      received += n;
      if (download_progress)
        download_progress(received, down_total);
    } else if (out.body.size() < kMaxBufferedBody) {
      out.body.append(chunk.data(), std::min(n, kMaxBufferedBody - out.body.size()));
    }
  }
  if (to_sink) {
    sink.close();
    if (!sink)
      throw std::runtime_error("close failed: " + sink_path->string());
  }
  return out;
}

} // namespace

struct Client::Impl {
  std::chrono::seconds timeout;
  ssl::context ctx{ssl::context::tls_client};

  template <class Body>
  Response exchange(const Url &url, bhttp::request<Body> &req,
                    const std::filesystem::path *sink_path, const TransferProgress &up,
                    const TransferProgress &down) {
    net::io_context ioc;
    try {
      tcp::resolver resolver(ioc);
      const auto endpoints = resolver.resolve(url.host, url.port);

      if (url.tls) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
          throw StoreError("TLS SNI setup failed for " + url.host, 0);
        stream.set_verify_callback(ssl::host_name_verification(url.host));

        auto &lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        run_op(ioc, [&](auto handler) { lowest.async_connect(endpoints, handler); });
        lowest.expires_after(timeout);
        run_op(ioc, [&](auto handler) {
          stream.async_handshake(ssl::stream_base::client, handler);
        });

        Response resp = converse(ioc, stream, timeout, req, sink_path, up, down);

        // Servers routinely drop the connection instead of a close_notify.
        lowest.expires_after(std::chrono::seconds(5));
        beast::error_code ignored;
        run_op(ioc, [&](auto handler) { stream.async_shutdown(handler); }, ignored);
        return resp;
      }

      beast::tcp_stream stream(ioc);
      stream.expires_after(timeout);
      run_op(ioc, [&](auto handler) { stream.async_connect(endpoints, handler); });
      Response resp = converse(ioc, stream, timeout, req, sink_path, up, down);
      beast::error_code ignored;
      stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
      return resp;
    } catch (const StoreError &) {
      throw;
    } catch (const beast::system_error &e) {
      throw StoreError(std::string(req.method_string()) + " " + url.host + url.target + ": " +
                           e.code().message(),
                       0);
    } catch (const std::exception &e) {
      throw StoreError(std::string(req.method_string()) + " " + url.host + url.target + ": " +
                           e.what(),
                       0);
    }
  }
};

Url Url::parse(std::string_view url) {
  Url out{};
  if (url.starts_with("https://")) {
    out.tls = true;
    url.remove_prefix(8);
  } else if (url.starts_with("http://")) {
    out.tls = false;
    url.remove_prefix(7);
  } else {
    throw std::invalid_argument("unsupported URL: " + std::string(url));
  }
  const auto slash = url.find('/');
  const std::string_view authority = url.substr(0, slash);
  out.target = slash == std::string_view::npos ? "/" : std::string(url.substr(slash));
  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    out.host = std::string(authority.substr(0, colon));
    out.port = std::string(authority.substr(colon + 1));
  } else {
    out.host = std::string(authority);
    out.port = out.tls ? "443" : "80";
  }
  if (out.host.empty() || out.port.empty())
    throw std::invalid_argument("malformed URL authority: " + std::string(authority));
  return out;
}

Client::Client(std::chrono::seconds timeout) : impl_(std::make_unique<Impl>()) {
  impl_->timeout = timeout;
  impl_->ctx.set_default_verify_paths();
  impl_->ctx.set_verify_mode(ssl::verify_peer);
}

Client::~Client() = default;

Response Client::send(std::string_view method, const std::string &url, const Headers &headers,
                      std::string body) {
  const Url u = Url::parse(url);
  bhttp::request<bhttp::string_body> req;
  prepare(req, method, u, headers);
  req.body() = std::move(body);
  req.prepare_payload();
  return impl_->exchange(u, req, nullptr, {}, {});
}

Response Client::send_file(std::string_view method, const std::string &url,
                           const Headers &headers, const std::filesystem::path &file,
                           const TransferProgress &progress) {
  const Url u = Url::parse(url);
  bhttp::request<bhttp::file_body> req;
  prepare(req, method, u, headers);
  beast::error_code ec;
  req.body().open(file.c_str(), beast::file_mode::scan, ec);
  if (ec)
    throw StoreError("open " + file.string() + ": " + ec.message(), 0);
  req.prepare_payload();
  return impl_->exchange(u, req, nullptr, progress, {});
}

Response Client::download(const std::string &url, const Headers &headers,
                          const std::filesystem::path &dest, const TransferProgress &progress,
                          int max_redirects, const std::vector<std::string> &origin_only) {
  const Url origin = Url::parse(url);
  std::string current = url;
  for (int hop = 0;; ++hop) {
    const Url u = Url::parse(current);
    Headers forwarded;
    for (const auto &h : headers) {
      const bool sensitive = std::ranges::any_of(origin_only, [&](const std::string &name) {
        return std::ranges::equal(name, h.first, [](char a, char b) {
          return std::tolower(static_cast<unsigned char>(a)) ==
                 std::tolower(static_cast<unsigned char>(b));
        });
      });
      if (!sensitive || u.host == origin.host)
        forwarded.push_back(h);
    }

    bhttp::request<bhttp::string_body> req;
    prepare(req, "GET", u, forwarded);
    req.prepare_payload();
    Response resp = impl_->exchange(u, req, &dest, {}, progress);
    if (!resp.redirect())
      return resp;
    if (hop >= max_redirects)
      throw StoreError("too many redirects fetching " + url, 0);
    if (resp.location.starts_with("/"))
      current = (u.tls ? "https://" : "http://") + host_header(u) + resp.location;
    else
      current = resp.location;
  }
}

std::string percent_encode(std::string_view s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0xF]);
    }
  }
  return out;
}

} // namespace lfsync::http
