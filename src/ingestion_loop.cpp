#include "sensestream/ingestion_loop.hpp"
#include "sensestream/errors.hpp"
#include "sensestream/log.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace sensestream {

namespace {

double number_or(const Record &r, const char *name, double def) {
  if (!r.has(name))
    return def;
  const FieldValue &v = r.get(name);
  if (const auto *d = std::get_if<double>(&v))
    return *d;
  if (const auto *i = std::get_if<std::int64_t>(&v))
    return static_cast<double>(*i);
  return def;
}

void log_sample(const Record &r) {
  char line[160];
  std::snprintf(line, sizeof(line),
                "sample: temp=%.1fC humidity=%.1f%% pressure=%.1fmb cpu=%.1f%%",
                number_or(r, "temperature", 0.0), number_or(r, "humidity", 0.0),
                number_or(r, "pressure", 0.0), number_or(r, "cpu_percent", 0.0));
  log_info("LOOP", line);
}

} // namespace

IngestionLoop::IngestionLoop(ReadingSource &source, ChannelSession &channel,
                             IngestStats &stats, CancellationToken &cancel,
                             LoopOptions opts)
    : source_(source), channel_(channel), stats_(stats), cancel_(cancel),
      opts_(opts) {}

std::vector<Record> IngestionLoop::collect() {
  std::vector<Record> batch;
  batch.reserve(opts_.batch_size);

  for (std::size_t i = 0; i < opts_.batch_size; ++i) {
    if (cancel_.cancelled())
      break;

    try {
      Record r = source_.read();
      validate(r, required_reading_fields());
      if (i == 0)
        log_sample(r);
      batch.push_back(std::move(r));
    } catch (const std::exception &e) {
      log_err("LOOP", std::string("error reading sensor: ") + e.what());
    }

    if (i + 1 < opts_.batch_size && !cancel_.sleep_for(opts_.reading_interval))
      break;
  }
  return batch;
}

bool IngestionLoop::send(const std::vector<Record> &batch) {
  for (std::size_t attempt = 0;; ++attempt) {
    bool retryable = true;
    try {
      channel_.append(batch);
      ++sent_;
      log_info("LOOP", "[OK] sent batch " + std::to_string(sent_) + ": " +
                           std::to_string(batch.size()) + " readings");
      return true;
    } catch (const ChannelError &e) {
      stats_.record_error();
      retryable = e.retryable();
      log_err("LOOP", std::string("error sending batch: ") + e.what() +
                          " (status " + std::to_string(e.status()) + ") " +
                          e.body());
    } catch (const CredentialError &e) {
      stats_.record_error();
      log_err("LOOP", std::string("credential error: ") + e.what());
    } catch (const ResolutionError &e) {
      stats_.record_error();
      log_err("LOOP", std::string("host resolution error: ") + e.what());
    } catch (const std::exception &e) {
      // например, не-UTF-8 строка при сериализации: повтор не поможет
      stats_.record_error();
      retryable = false;
      log_err("LOOP", std::string("error sending batch: ") + e.what());
    }

    if (!retryable || attempt >= opts_.append_retries || cancel_.cancelled())
      break;

    const auto backoff = opts_.retry_backoff * (1LL << std::min<std::size_t>(attempt, 6));
    log_warn("LOOP", "retrying batch in " + std::to_string(backoff.count()) +
                         "ms (attempt " + std::to_string(attempt + 2) + ")");
    if (!cancel_.sleep_for(backoff))
      break;
  }

  ++dropped_;
  log_warn("LOOP", "dropped batch of " + std::to_string(batch.size()) +
                       " readings, offset stays at " +
                       std::to_string(channel_.offset()));
  return false;
}

bool IngestionLoop::run_once() {
  const std::vector<Record> batch = collect();
  if (batch.empty() || cancel_.cancelled())
    return false;
  return send(batch);
}

std::size_t IngestionLoop::run() {
  log_info("LOOP", "starting data streaming... (Ctrl+C to stop)");

  std::size_t attempted = 0;
  while (!cancel_.cancelled()) {
    if (opts_.max_batches > 0 && attempted >= opts_.max_batches) {
      log_info("LOOP", "reached max batches (" + std::to_string(opts_.max_batches) + ")");
      break;
    }

    const bool ok = run_once();
    ++attempted;
    if (ok && opts_.stats_every > 0 && sent_ % opts_.stats_every == 0)
      stats_.report();

    if (opts_.max_batches > 0 && attempted >= opts_.max_batches)
      continue;
    if (!cancel_.sleep_for(opts_.batch_interval))
      break;
  }
  return sent_;
}

} // namespace sensestream
