#pragma once
#include "credential_provider.hpp"
#include "http_client.hpp"
#include "record.hpp"
#include "stats.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace sensestream {

enum class ChannelState { Unopened, Open, Closed };

const char *to_string(ChannelState s) noexcept;

struct AppendResult {
  std::size_t rows = 0;
  std::size_t bytes = 0;
  std::int64_t offset = 0; // offset after the append
};

struct ChannelStatus {
  std::int64_t committed_offset = 0;
  std::string raw; // server JSON for this channel
};

// Канал внутри pipe. Один писатель, параллельный append() отклоняется.
class ChannelSession {
public:
  ChannelSession(const StreamConfig &cfg, CredentialProvider &creds,
                 HttpTransport &http, IngestStats &stats,
                 std::time_t created = std::time(nullptr),
                 Sleeper sleeper = nullptr);

  ChannelSession(const ChannelSession &) = delete;
  ChannelSession &operator=(const ChannelSession &) = delete;

  void open();

  // токен и offset меняются только после 2xx
  AppendResult append(const std::vector<Record> &records);

  ChannelStatus get_status();

  // false по таймауту; ошибки опроса только логируются
  bool wait_for_commit(std::int64_t expected_offset,
                       std::chrono::milliseconds timeout,
                       std::chrono::milliseconds poll_interval);

  void close();

  ChannelState state() const noexcept { return state_; }
  const std::string &name() const noexcept { return name_; }
  const std::string &continuation_token() const noexcept { return continuation_; }
  std::int64_t offset() const noexcept { return offset_; }

private:
  std::string pipe_path(const std::string &host) const;
  HttpResponse send(const HttpRequest &req, const char *what);

  const StreamConfig cfg_;
  CredentialProvider &creds_;
  HttpTransport &http_;
  IngestStats &stats_;
  Sleeper sleeper_;

  const std::string name_;
  ChannelState state_ = ChannelState::Unopened;
  std::string continuation_;
  std::int64_t offset_ = 0;
  std::atomic<bool> append_in_flight_{false};
};

} // namespace sensestream
