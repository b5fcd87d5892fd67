#pragma once
#include "record.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace sensestream {

// Producer of readings; the ingestion loop only sees Records.
class ReadingSource {
public:
  virtual ~ReadingSource() = default;
  // May throw; the loop logs and skips the reading.
  virtual Record read() = 0;
};

// Fields every reading must carry before it is serialized.
const std::vector<std::string> &required_reading_fields();

struct SystemMetrics {
  double cpu_percent = 0.0;
  double memory_percent = 0.0;
  double disk_usage_mb = 0.0;
  double cpu_temp_c = 0.0;
  double cpu_temp_f = 32.0;
};

// Linux host metrics from /proc, statvfs and the thermal zone. Unreadable
// sources yield zeroes.
class SystemProbe {
public:
  explicit SystemProbe(std::string root = "/");

  SystemMetrics sample();

private:
  bool read_cpu_times(std::uint64_t &idle, std::uint64_t &total) const;

  const std::string root_;
  std::uint64_t prev_idle_ = 0;
  std::uint64_t prev_total_ = 0;
};

// Sense HAT shaped readings with simulated environment and IMU values plus
// host identity and system metrics.
class SimulatedSenseHat : public ReadingSource {
public:
  SimulatedSenseHat();
  explicit SimulatedSenseHat(std::uint64_t seed);

  Record read() override;

  std::uint64_t reading_count() const noexcept { return count_; }

private:
  std::mt19937_64 rng_;
  SystemProbe probe_;
  std::string hostname_;
  std::string ip_;
  std::string mac_;
  std::uint64_t count_ = 0;
};

} // namespace sensestream
