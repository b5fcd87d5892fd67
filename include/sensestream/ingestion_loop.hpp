#pragma once
#include "cancellation.hpp"
#include "channel_session.hpp"
#include "sensor_source.hpp"
#include "stats.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

namespace sensestream {

struct LoopOptions {
  std::size_t batch_size = 10;
  std::chrono::milliseconds batch_interval{5000};
  std::chrono::milliseconds reading_interval{500};
  std::size_t max_batches = 0; // 0 = until cancelled
  std::size_t stats_every = 10; // 0 = only at shutdown
  // Extra attempts for a batch failing with a retryable error (transport,
  // 429, 5xx). 0 = the batch is dropped after the first failure.
  std::size_t append_retries = 0;
  std::chrono::milliseconds retry_backoff{1000};
};

// Reads batch_size readings, appends them as one batch, sleeps, repeats.
// A failed batch is counted and logged; the loop keeps going with the
// channel's last acknowledged offset and continuation token.
class IngestionLoop {
public:
  IngestionLoop(ReadingSource &source, ChannelSession &channel,
                IngestStats &stats, CancellationToken &cancel,
                LoopOptions opts);

  // Returns the number of batches sent successfully.
  std::size_t run();

  // One batch: collect, then append. Returns true if it was acknowledged.
  bool run_once();

  std::size_t batches_sent() const noexcept { return sent_; }
  std::size_t batches_dropped() const noexcept { return dropped_; }

private:
  std::vector<Record> collect();
  bool send(const std::vector<Record> &batch);

  ReadingSource &source_;
  ChannelSession &channel_;
  IngestStats &stats_;
  CancellationToken &cancel_;
  const LoopOptions opts_;
  std::size_t sent_ = 0;
  std::size_t dropped_ = 0;
};

} // namespace sensestream
