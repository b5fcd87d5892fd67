#include "sensestream/cancellation.hpp"
#include "sensestream/channel_session.hpp"
#include "sensestream/config.hpp"
#include "sensestream/credential_provider.hpp"
#include "sensestream/errors.hpp"
#include "sensestream/http_client.hpp"
#include "sensestream/ingestion_loop.hpp"
#include "sensestream/log.hpp"
#include "sensestream/sensor_source.hpp"
#include "sensestream/stats.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/thread/thread.hpp>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

using sensestream::log_err;
using sensestream::log_info;

static void print_usage(const char *prog) {
  std::fprintf(
      stderr,
      "Usage: %s [options]\n"
      "  -c, --config PATH           config file (default snowflake_config.json)\n"
      "  -b, --batch-size N          readings per batch (default 10)\n"
      "  -i, --interval SEC          seconds between batches (default 5.0)\n"
      "  -r, --reading-interval SEC  seconds between readings (default 0.5)\n"
      "      --max-batches N         stop after N batches (default 0 = unlimited)\n"
      "      --stats-every N         print statistics every N batches (default 10)\n"
      "      --append-retries N      retries for transient append failures (default 0)\n"
      "      --log-file PATH         append-only log file (default sensehat_streaming.log)\n"
      "  -v, --verbose               debug logging\n"
      "  -h, --help                  this text\n",
      prog);
}

// 0: continue, -1: help printed, 2: usage error.
static int parse_args(int argc, char **argv, sensestream::RunOptions &opts) {
  auto as_size = [](const std::string &v, std::size_t &out) {
    char *end = nullptr;
    const long long n = std::strtoll(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0' || n < 0)
      return false;
    out = static_cast<std::size_t>(n);
    return true;
  };
  auto as_seconds = [](const std::string &v, double &out) {
    char *end = nullptr;
    const double d = std::strtod(v.c_str(), &end);
    if (v.empty() || *end != '\0' || d < 0.0)
      return false;
    out = d;
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    const bool has_value = i + 1 < argc;
    bool ok = true;

    if (a == "-h" || a == "--help") {
      print_usage(argv[0]);
      return -1;
    } else if (a == "-v" || a == "--verbose") {
      opts.verbose = true;
    } else if (!has_value) {
      ok = false;
    } else if (a == "-c" || a == "--config") {
      opts.config_path = argv[++i];
    } else if (a == "--log-file") {
      opts.log_file = argv[++i];
    } else if (a == "-b" || a == "--batch-size") {
      ok = as_size(argv[++i], opts.batch_size) && opts.batch_size > 0;
    } else if (a == "-i" || a == "--interval") {
      ok = as_seconds(argv[++i], opts.batch_interval_s);
    } else if (a == "-r" || a == "--reading-interval") {
      ok = as_seconds(argv[++i], opts.reading_interval_s);
    } else if (a == "--max-batches") {
      ok = as_size(argv[++i], opts.max_batches);
    } else if (a == "--stats-every") {
      ok = as_size(argv[++i], opts.stats_every);
    } else if (a == "--append-retries") {
      ok = as_size(argv[++i], opts.append_retries);
    } else {
      ok = false;
    }

    if (!ok) {
      std::fprintf(stderr, "invalid argument: %s\n", a.c_str());
      print_usage(argv[0]);
      return 2;
    }
  }
  return 0;
}

static std::chrono::milliseconds to_ms(double seconds) {
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

int main(int argc, char **argv) {
  sensestream::install_terminate_handler();

  sensestream::RunOptions opts;
  if (const int rc = parse_args(argc, argv, opts); rc != 0)
    return rc < 0 ? 0 : rc;

  if (opts.verbose)
    sensestream::set_log_level(sensestream::LogLevel::Debug);
  if (!opts.log_file.empty())
    sensestream::open_log_file(opts.log_file);

  log_info("MAIN", std::string(70, '='));
  log_info("MAIN", "SENSE HAT TO SNOWFLAKE STREAMING (Snowpipe Streaming v2 REST)");
  log_info("MAIN", std::string(70, '='));
  log_info("MAIN", "config: " + opts.config_path);
  log_info("MAIN", "batch size: " + std::to_string(opts.batch_size));
  log_info("MAIN", "batch interval: " + std::to_string(opts.batch_interval_s) + "s");
  log_info("MAIN", "reading interval: " + std::to_string(opts.reading_interval_s) + "s");

  sensestream::StreamConfig cfg;
  try {
    cfg = sensestream::load_config(opts.config_path);
    log_info("MAIN", "loaded config from " + opts.config_path);
  } catch (const sensestream::ConfigurationError &e) {
    log_err("MAIN", std::string("configuration error: ") + e.what());
    return 1;
  }

  sensestream::BeastHttpClient http(std::chrono::milliseconds(cfg.request_timeout_ms));
  sensestream::IngestStats stats;
  sensestream::CancellationToken cancel;

  std::unique_ptr<sensestream::SimulatedSenseHat> sensor;
  std::unique_ptr<sensestream::CredentialProvider> creds;
  std::unique_ptr<sensestream::ChannelSession> channel;
  try {
    sensor = std::make_unique<sensestream::SimulatedSenseHat>();
    creds = std::make_unique<sensestream::CredentialProvider>(cfg, http);
    channel = std::make_unique<sensestream::ChannelSession>(cfg, *creds, http, stats);
    creds->ingest_host();
    channel->open();
    log_info("MAIN", "streaming channel opened");
  } catch (const std::exception &e) {
    log_err("MAIN", std::string("failed to initialize streaming client: ") + e.what());
    return 1;
  }

  // Сигналы обрабатываем в отдельном потоке, цикл приёма крутится в main
  boost::asio::io_context ioc;
  auto guard = boost::asio::make_work_guard(ioc.get_executor());
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (ec)
      return;
    log_info("SIG", "received signal " + std::to_string(signo) + ", shutting down...");
    cancel.cancel();
  });
  boost::thread signal_thread([&ioc] { ioc.run(); });

  sensestream::LoopOptions lo;
  lo.batch_size = opts.batch_size;
  lo.batch_interval = to_ms(opts.batch_interval_s);
  lo.reading_interval = to_ms(opts.reading_interval_s);
  lo.max_batches = opts.max_batches;
  lo.stats_every = opts.stats_every;
  lo.append_retries = opts.append_retries;

  sensestream::IngestionLoop loop(*sensor, *channel, stats, cancel, lo);
  try {
    loop.run();
  } catch (const std::exception &e) {
    log_err("MAIN", std::string("unexpected error: ") + e.what());
  }

  log_info("MAIN", std::string(70, '='));
  log_info("MAIN", "shutting down...");
  log_info("MAIN", std::string(70, '='));
  stats.report();
  channel->close();

  boost::system::error_code ignored;
  signals.cancel(ignored);
  guard.reset();
  ioc.stop();
  signal_thread.join();

  log_info("MAIN", "shutdown complete");
  sensestream::close_log_file();
  return 0;
}
