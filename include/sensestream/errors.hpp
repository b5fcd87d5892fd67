#pragma once
#include <stdexcept>
#include <string>

namespace sensestream {

// Missing or contradictory settings; fatal at startup.
class ConfigurationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Key loading, JWT signing or token exchange failed.
class CredentialError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Ingest host discovery failed.
class ResolutionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Timeout, connection reset, DNS or TLS failure below HTTP.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Non-2xx (or transport failure, status 0) on open/append/status.
class ChannelError : public std::runtime_error {
public:
  ChannelError(const std::string &what, int status, std::string body)
      : std::runtime_error(what), status_(status), body_(std::move(body)) {}

  int status() const noexcept { return status_; }
  const std::string &body() const noexcept { return body_; }

  // 429 и 5xx, а также сетевые сбои имеет смысл повторить
  bool retryable() const noexcept {
    return status_ == 0 || status_ == 429 || status_ >= 500;
  }

private:
  int status_;
  std::string body_;
};

} // namespace sensestream
