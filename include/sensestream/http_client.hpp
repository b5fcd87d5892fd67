#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sensestream {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method; // GET, POST, PUT
  std::string url;    // http(s)://host[:port]/path?query
  HttpHeaders headers;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::string body;
  std::string content_type;

  bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Seam between the streaming protocol and the network. Implementations
// return any HTTP status as a response and throw TransportError when no
// response could be obtained within the deadline.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse send(const HttpRequest &req) = 0;
};

// Boost.Beast client: one connection per request, TLS for https://.
class BeastHttpClient : public HttpTransport {
public:
  explicit BeastHttpClient(std::chrono::milliseconds timeout);
  ~BeastHttpClient() override;

  HttpResponse send(const HttpRequest &req) override;

private:
  struct Impl;
  std::chrono::milliseconds timeout_;
  std::unique_ptr<Impl> impl_;
};

struct ParsedUrl {
  bool tls = true;
  std::string host;
  std::string port;
  std::string target; // path + query, at least "/"
};

// Throws std::invalid_argument on anything that is not http(s)://host...
ParsedUrl parse_url(const std::string &url);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string &s);

// application/x-www-form-urlencoded body / query string.
std::string form_encode(const std::vector<std::pair<std::string, std::string>> &kv);

} // namespace sensestream
