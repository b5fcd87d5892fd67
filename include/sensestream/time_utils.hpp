#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace sensestream {

inline std::int64_t system_clock_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline std::string format_local_time(std::time_t t, const char *fmt) {
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

inline std::string format_utc_time(std::time_t t, const char *fmt) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

// Суффикс имени канала, уникален для каждого запуска: 20260131_235959
inline std::string channel_suffix(std::time_t t) {
  return format_local_time(t, "%Y%m%d_%H%M%S");
}

// 2026-01-31T23:59:59.123456+00:00
inline std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch())
                      .count();
  const std::time_t secs = static_cast<std::time_t>(us / 1'000'000);
  char frac[16];
  std::snprintf(frac, sizeof(frac), ".%06lld",
                static_cast<long long>(us % 1'000'000));
  return format_utc_time(secs, "%Y-%m-%dT%H:%M:%S") + frac + "+00:00";
}

} // namespace sensestream
