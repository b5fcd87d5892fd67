// src/http_client.cpp
#include "sensestream/http_client.hpp"
#include "sensestream/errors.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <cctype>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace sensestream {

struct BeastHttpClient::Impl {
  net::io_context ioc;
  ssl::context ssl_ctx{ssl::context::tls_client};
};

namespace {

std::string to_std(beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}

// Запускает одну асинхронную операцию и крутит ioc до её завершения.
// Дедлайн задаётся через tcp_stream::expires_after.
template <class Start>
beast::error_code run_op(net::io_context &ioc, Start &&start) {
  beast::error_code result = net::error::would_block;
  start([&result](beast::error_code ec, auto &&...) { result = ec; });
  ioc.restart();
  ioc.run();
  return result;
}

void throw_transport(const char *stage, const std::string &host,
                     const beast::error_code &ec) {
  const std::string why =
      ec == beast::error::timeout ? std::string("timed out") : ec.message();
  throw TransportError(std::string(stage) + " " + host + ": " + why);
}

tcp::resolver::results_type resolve(net::io_context &ioc, const ParsedUrl &u,
                                    std::chrono::milliseconds timeout) {
  tcp::resolver resolver(ioc);
  net::steady_timer timer(ioc);
  tcp::resolver::results_type endpoints;
  beast::error_code result = net::error::would_block;

  timer.expires_after(timeout);
  timer.async_wait([&resolver](const beast::error_code &ec) {
    if (!ec)
      resolver.cancel();
  });
  resolver.async_resolve(
      u.host, u.port,
      [&](const beast::error_code &ec, tcp::resolver::results_type r) {
        result = ec;
        endpoints = std::move(r);
        timer.cancel();
      });
  ioc.restart();
  ioc.run();

  if (result == net::error::operation_aborted)
    throw TransportError("resolve " + u.host + ": timed out");
  if (result)
    throw_transport("resolve", u.host, result);
  return endpoints;
}

http::request<http::string_body> build_request(const HttpRequest &in,
                                               const ParsedUrl &u) {
  const http::verb verb = http::string_to_verb(in.method);
  if (verb == http::verb::unknown)
    throw std::invalid_argument("unsupported HTTP method: " + in.method);

  http::request<http::string_body> req{verb, u.target, 11};
  req.set(http::field::host, u.host);
  req.set(http::field::user_agent, "sensestream/1.0");
  req.set(http::field::accept, "application/json, text/plain");
  for (const auto &h : in.headers)
    req.set(h.first, h.second);
  req.body() = in.body;
  req.prepare_payload();
  return req;
}

template <class Stream>
HttpResponse exchange(net::io_context &ioc, Stream &stream,
                      const http::request<http::string_body> &req,
                      const std::string &host) {
  auto ec = run_op(ioc, [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  });
  if (ec)
    throw_transport("write", host, ec);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  ec = run_op(ioc, [&](auto handler) {
    http::async_read(stream, buffer, res, std::move(handler));
  });
  if (ec)
    throw_transport("read", host, ec);

  HttpResponse out;
  out.status = static_cast<int>(res.result_int());
  out.body = std::move(res.body());
  out.content_type = to_std(res[http::field::content_type]);
  return out;
}

} // namespace

BeastHttpClient::BeastHttpClient(std::chrono::milliseconds timeout)
    : timeout_(timeout), impl_(std::make_unique<Impl>()) {
  impl_->ssl_ctx.set_default_verify_paths();
  impl_->ssl_ctx.set_verify_mode(ssl::verify_peer);
}

BeastHttpClient::~BeastHttpClient() = default;

HttpResponse BeastHttpClient::send(const HttpRequest &in) {
  const ParsedUrl u = parse_url(in.url);
  const auto req = build_request(in, u);
  auto &ioc = impl_->ioc;

  const auto endpoints = resolve(ioc, u, timeout_);

  if (!u.tls) {
    beast::tcp_stream stream(ioc);
    stream.expires_after(timeout_);
    auto ec = run_op(ioc, [&](auto handler) {
      stream.async_connect(endpoints, std::move(handler));
    });
    if (ec)
      throw_transport("connect", u.host, ec);

    auto res = exchange(ioc, stream, req, u.host);
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return res;
  }

  beast::ssl_stream<beast::tcp_stream> stream(ioc, impl_->ssl_ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
    beast::error_code ec{static_cast<int>(::ERR_get_error()),
                         net::error::get_ssl_category()};
    throw_transport("sni", u.host, ec);
  }
  stream.set_verify_callback(ssl::host_name_verification(u.host));

  beast::get_lowest_layer(stream).expires_after(timeout_);
  auto ec = run_op(ioc, [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
  });
  if (ec)
    throw_transport("connect", u.host, ec);

  ec = run_op(ioc, [&](auto handler) {
    stream.async_handshake(ssl::stream_base::client, std::move(handler));
  });
  if (ec)
    throw_transport("tls handshake", u.host, ec);

  auto res = exchange(ioc, stream, req, u.host);

  // сервер часто рвёт соединение без close_notify, это не ошибка
  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(2));
  run_op(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
  return res;
}

ParsedUrl parse_url(const std::string &url) {
  ParsedUrl u;
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    u.tls = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    u.tls = false;
    rest = url.substr(7);
  } else {
    throw std::invalid_argument("unsupported URL scheme: " + url);
  }

  const auto slash = rest.find_first_of("/?");
  std::string authority = rest.substr(0, slash);
  u.target = slash == std::string::npos ? "/" : rest.substr(slash);
  if (!u.target.empty() && u.target.front() == '?')
    u.target.insert(u.target.begin(), '/');

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    u.port = authority.substr(colon + 1);
    authority.resize(colon);
  } else {
    u.port = u.tls ? "443" : "80";
  }
  u.host = authority;
  if (u.host.empty())
    throw std::invalid_argument("URL without host: " + url);
  return u;
}

std::string url_encode(const std::string &s) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string
form_encode(const std::vector<std::pair<std::string, std::string>> &kv) {
  std::string out;
  for (const auto &p : kv) {
    if (!out.empty())
      out.push_back('&');
    out += url_encode(p.first);
    out.push_back('=');
    out += url_encode(p.second);
  }
  return out;
}

} // namespace sensestream
