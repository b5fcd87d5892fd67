#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace sensestream {

struct StatsSnapshot {
  std::uint64_t rows = 0;
  std::uint64_t batches = 0;
  std::uint64_t bytes = 0;
  std::uint64_t errors = 0;
  double elapsed_s = 0.0;
  double rows_per_sec = 0.0;
};

// Monotonic counters since process start. Written by the ingestion loop,
// read by whoever prints them; relaxed atomics are enough.
class IngestStats {
public:
  IngestStats() : start_(std::chrono::steady_clock::now()) {}

  void record_batch(std::uint64_t rows, std::uint64_t bytes) {
    rows_.fetch_add(rows, std::memory_order_relaxed);
    batches_.fetch_add(1, std::memory_order_relaxed);
    bytes_.fetch_add(bytes, std::memory_order_relaxed);
  }
  void record_error() { errors_.fetch_add(1, std::memory_order_relaxed); }

  std::uint64_t rows() const { return rows_.load(std::memory_order_relaxed); }
  std::uint64_t batches() const { return batches_.load(std::memory_order_relaxed); }
  std::uint64_t bytes() const { return bytes_.load(std::memory_order_relaxed); }
  std::uint64_t errors() const { return errors_.load(std::memory_order_relaxed); }

  StatsSnapshot snapshot() const;

  // Logs the statistics block at INFO.
  void report() const;

private:
  const std::chrono::steady_clock::time_point start_;
  std::atomic<std::uint64_t> rows_{0};
  std::atomic<std::uint64_t> batches_{0};
  std::atomic<std::uint64_t> bytes_{0};
  std::atomic<std::uint64_t> errors_{0};
};

} // namespace sensestream
