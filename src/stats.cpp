#include "sensestream/stats.hpp"
#include "sensestream/log.hpp"

#include <cstdio>
#include <string>

namespace sensestream {

StatsSnapshot IngestStats::snapshot() const {
  StatsSnapshot s;
  s.rows = rows();
  s.batches = batches();
  s.bytes = bytes();
  s.errors = errors();
  s.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                              start_)
                    .count();
  if (s.rows > 0 && s.elapsed_s > 0.0)
    s.rows_per_sec = static_cast<double>(s.rows) / s.elapsed_s;
  return s;
}

void IngestStats::report() const {
  const StatsSnapshot s = snapshot();
  char line[64];

  log_info("STATS", std::string(50, '='));
  log_info("STATS", "INGESTION STATISTICS");
  log_info("STATS", std::string(50, '='));
  log_info("STATS", "Total rows: " + std::to_string(s.rows));
  log_info("STATS", "Batches: " + std::to_string(s.batches));
  log_info("STATS", "Bytes sent: " + std::to_string(s.bytes));
  log_info("STATS", "Errors: " + std::to_string(s.errors));
  std::snprintf(line, sizeof(line), "Elapsed: %.2fs", s.elapsed_s);
  log_info("STATS", line);
  if (s.rows > 0) {
    std::snprintf(line, sizeof(line), "Throughput: %.2f rows/sec", s.rows_per_sec);
    log_info("STATS", line);
  }
  log_info("STATS", std::string(50, '='));
}

} // namespace sensestream
