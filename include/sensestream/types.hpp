#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace sensestream {

enum class AuthMode { KeyPair, ProgrammaticToken };

// Loaded once from the JSON config file, never mutated afterwards.
struct StreamConfig {
  std::string account;
  std::string user;
  std::string database;
  std::string schema;
  std::string pipe;
  std::string url; // control plane; empty -> https://{account}.snowflakecomputing.com
  std::string channel_name = "SENSEHAT_CHNL";

  // ровно один из двух способов аутентификации
  std::string private_key_file;
  std::string private_key_passphrase;
  std::string pat_token;

  int request_timeout_ms = 30000;

  AuthMode auth_mode() const noexcept {
    return pat_token.empty() ? AuthMode::KeyPair : AuthMode::ProgrammaticToken;
  }
  std::string control_url() const;
};

// Command line options, see main.cpp.
struct RunOptions {
  std::string config_path = "snowflake_config.json";
  std::string log_file = "sensehat_streaming.log";
  std::size_t batch_size = 10;
  double batch_interval_s = 5.0;
  double reading_interval_s = 0.5;
  std::size_t max_batches = 0; // 0 = unlimited
  std::size_t stats_every = 10;
  std::size_t append_retries = 0;
  bool verbose = false;
};

// Seconds since the Unix epoch; injected so token lifetimes are testable.
using Clock = std::function<std::int64_t()>;

// Blocking wait used by commit polling.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

} // namespace sensestream
