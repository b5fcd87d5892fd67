#include <gtest/gtest.h>

#include <sensestream/cancellation.hpp>
#include <sensestream/errors.hpp>
#include <sensestream/http_client.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/thread/thread.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using sensestream::BeastHttpClient;
using sensestream::HttpRequest;
using sensestream::TransportError;

namespace {

// Однопоточный сервер на 127.0.0.1: принимает одно соединение
// и отдаёт сокет обработчику.
class LocalServer {
public:
  using Handler = std::function<void(tcp::socket &, sensestream::CancellationToken &)>;

  explicit LocalServer(Handler handler)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        port_(acceptor_.local_endpoint().port()) {
    thread_ = boost::thread([this, handler] {
      tcp::socket socket(ioc_);
      boost::system::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec)
        return;
      handler(socket, release_);
      socket.shutdown(tcp::socket::shutdown_both, ec);
      socket.close(ec);
    });
  }

  ~LocalServer() {
    release_.cancel();
    thread_.join();
  }

  std::string url(const std::string &target) const {
    return "http://127.0.0.1:" + std::to_string(port_) + target;
  }

private:
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  unsigned short port_;
  sensestream::CancellationToken release_;
  boost::thread thread_;
};

struct SeenRequest {
  std::string method;
  std::string target;
  std::string token_type;
  std::string body;
};

} // namespace

TEST(BeastHttpClient, RoundTripOverPlainHttp) {
  SeenRequest seen;
  sensestream::HttpResponse res;
  {
    LocalServer server([&seen](tcp::socket &s, sensestream::CancellationToken &) {
      boost::beast::flat_buffer buf;
      http::request<http::string_body> req;
      boost::system::error_code ec;
      http::read(s, buf, req, ec);
      if (ec)
        return;
      seen.method = std::string(req.method_string());
      seen.target = std::string(req.target());
      seen.token_type = std::string(req["X-Snowflake-Authorization-Token-Type"]);
      seen.body = req.body();

      http::response<http::string_body> out{http::status::ok, req.version()};
      out.set(http::field::content_type, "application/json");
      out.body() = R"({"ok":true})";
      out.prepare_payload();
      http::write(s, out, ec);
    });

    BeastHttpClient client(std::chrono::milliseconds(2000));
    HttpRequest req;
    req.method = "POST";
    req.url = server.url("/v2/streaming/hostname?x=1");
    req.headers = {{"X-Snowflake-Authorization-Token-Type", "KEYPAIR_JWT"},
                   {"Content-Type", "application/x-ndjson"}};
    req.body = "{\"a\":1}\n";
    res = client.send(req);
  }

  EXPECT_EQ(res.status, 200);
  EXPECT_TRUE(res.ok());
  EXPECT_EQ(res.body, R"({"ok":true})");
  EXPECT_EQ(res.content_type, "application/json");

  EXPECT_EQ(seen.method, "POST");
  EXPECT_EQ(seen.target, "/v2/streaming/hostname?x=1");
  EXPECT_EQ(seen.token_type, "KEYPAIR_JWT");
  EXPECT_EQ(seen.body, "{\"a\":1}\n");
}

TEST(BeastHttpClient, SilentPeerHitsDeadline) {
  LocalServer server([](tcp::socket &s, sensestream::CancellationToken &release) {
    boost::beast::flat_buffer buf;
    http::request<http::string_body> req;
    boost::system::error_code ec;
    http::read(s, buf, req, ec);
    // ответа нет: держим соединение, пока тест не закончится
    release.sleep_for(std::chrono::seconds(30));
  });

  BeastHttpClient client(std::chrono::milliseconds(300));
  HttpRequest req;
  req.method = "GET";
  req.url = server.url("/v2/streaming/hostname");

  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(client.send(req), TransportError);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(BeastHttpClient, ClosedPortIsTransportError) {
  unsigned short port = 0;
  {
    // свободный порт: открыли и сразу закрыли
    net::io_context ioc;
    tcp::acceptor spare(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = spare.local_endpoint().port();
  }

  BeastHttpClient client(std::chrono::milliseconds(1000));
  HttpRequest req;
  req.method = "GET";
  req.url = "http://127.0.0.1:" + std::to_string(port) + "/";
  EXPECT_THROW(client.send(req), TransportError);
}
