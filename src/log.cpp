#include "sensestream/log.hpp"
#include "sensestream/time_utils.hpp"

#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>

namespace sensestream {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
boost::mutex g_mutex;
std::FILE *g_file = nullptr; // guarded by g_mutex

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

[[noreturn]] void log_terminate() {
  std::string why = "no active exception";
  if (const std::exception_ptr ep = std::current_exception()) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      why = e.what();
    } catch (...) {
      why = "non-standard exception";
    }
  }
  log_msg(LogLevel::Error, "FATAL", "std::terminate: " + why);
  std::abort();
}

} // namespace

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool open_log_file(const std::string &path) {
  std::FILE *f = std::fopen(path.c_str(), "a");
  if (!f) {
    log_warn("LOG", "cannot open log file " + path + ", logging to stderr only");
    return false;
  }
  boost::lock_guard<boost::mutex> lk(g_mutex);
  if (g_file)
    std::fclose(g_file);
  g_file = f;
  return true;
}

void close_log_file() {
  boost::lock_guard<boost::mutex> lk(g_mutex);
  if (g_file) {
    std::fclose(g_file);
    g_file = nullptr;
  }
}

void install_terminate_handler() { std::set_terminate(log_terminate); }

void log_msg(LogLevel level, const char *tag, const std::string &msg) {
  if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed))
    return;

  const std::string stamp = format_local_time(std::time(nullptr), "%Y-%m-%d %H:%M:%S");

  boost::lock_guard<boost::mutex> lk(g_mutex);
  std::fprintf(stderr, "%s [%s] %s - %s\n", stamp.c_str(), level_name(level),
               tag, msg.c_str());
  std::fflush(stderr);
  if (g_file) {
    std::fprintf(g_file, "%s [%s] %s - %s\n", stamp.c_str(), level_name(level),
                 tag, msg.c_str());
    std::fflush(g_file);
  }
}

} // namespace sensestream
