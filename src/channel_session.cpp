#include "sensestream/channel_session.hpp"
#include "sensestream/errors.hpp"
#include "sensestream/log.hpp"
#include "sensestream/time_utils.hpp"

#include <boost/thread/thread.hpp>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sensestream {

namespace {

// Offset tokens may come back as numbers, numeric strings or null.
std::int64_t parse_offset(const json &v) {
  if (v.is_number_unsigned()) {
    const auto u = v.get<std::uint64_t>();
    if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
      return static_cast<std::int64_t>(u);
    log_warn("CHAN", "offset token " + v.dump() + " out of range, using 0");
    return 0;
  }
  if (v.is_number_integer())
    return v.get<std::int64_t>();
  if (v.is_number()) {
    // 2^63 точно представимо в double, сравниваем строго
    const double d = v.get<double>();
    if (std::isfinite(d) && d >= -9223372036854775808.0 && d < 9223372036854775808.0)
      return static_cast<std::int64_t>(d);
    log_warn("CHAN", "offset token " + v.dump() + " out of range, using 0");
    return 0;
  }
  if (v.is_string()) {
    const auto s = v.get<std::string>();
    char *end = nullptr;
    errno = 0;
    const long long n = std::strtoll(s.c_str(), &end, 10);
    if (!s.empty() && errno == 0 && end && *end == '\0')
      return n;
    log_warn("CHAN", "non-numeric offset token '" + s + "', using 0");
  }
  return 0;
}

json parse_body(const HttpResponse &res, const char *what) {
  try {
    return json::parse(res.body);
  } catch (const json::parse_error &e) {
    throw ChannelError(std::string(what) + ": malformed response: " + e.what(),
                       res.status, res.body);
  }
}

void sleep_thread(std::chrono::milliseconds d) {
  boost::this_thread::sleep_for(boost::chrono::milliseconds(d.count()));
}

// Снимает флаг append_in_flight_ при любом выходе из append().
class InFlightGuard {
public:
  explicit InFlightGuard(std::atomic<bool> &flag) : flag_(flag) {}
  ~InFlightGuard() { flag_.store(false); }

private:
  std::atomic<bool> &flag_;
};

} // namespace

const char *to_string(ChannelState s) noexcept {
  switch (s) {
  case ChannelState::Unopened:
    return "UNOPENED";
  case ChannelState::Open:
    return "OPEN";
  case ChannelState::Closed:
    return "CLOSED";
  }
  return "UNKNOWN";
}

ChannelSession::ChannelSession(const StreamConfig &cfg,
                               CredentialProvider &creds, HttpTransport &http,
                               IngestStats &stats, std::time_t created,
                               Sleeper sleeper)
    : cfg_(cfg), creds_(creds), http_(http), stats_(stats),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper(sleep_thread)),
      name_(cfg.channel_name + "_" + channel_suffix(created)) {
  log_info("CHAN", "database=" + cfg_.database + " schema=" + cfg_.schema +
                       " pipe=" + cfg_.pipe + " channel=" + name_);
}

std::string ChannelSession::pipe_path(const std::string &host) const {
  return "https://" + host + "/v2/streaming/databases/" +
         url_encode(cfg_.database) + "/schemas/" + url_encode(cfg_.schema) +
         "/pipes/" + url_encode(cfg_.pipe);
}

HttpResponse ChannelSession::send(const HttpRequest &req, const char *what) {
  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError &e) {
    throw ChannelError(std::string(what) + " failed: " + e.what(), 0, "");
  }
  if (!res.ok())
    throw ChannelError(std::string(what) + " failed: HTTP " +
                           std::to_string(res.status),
                       res.status, res.body);
  return res;
}

void ChannelSession::open() {
  if (state_ != ChannelState::Unopened)
    throw ChannelError(std::string("open channel: session is ") + to_string(state_),
                       0, "");

  log_info("CHAN", "opening channel " + name_);
  const std::string token = creds_.scoped_token();
  const std::string &host = creds_.ingest_host();

  HttpRequest req;
  req.method = "PUT";
  req.url = pipe_path(host) + "/channels/" + url_encode(name_);
  req.headers = {{"Authorization", "Bearer " + token},
                 {"Content-Type", "application/json"}};
  req.body = "{}";

  const HttpResponse res = send(req, "open channel");
  const json j = parse_body(res, "open channel");

  if (!j.is_object() || !j.contains("next_continuation_token") ||
      !j["next_continuation_token"].is_string() ||
      j["next_continuation_token"].get<std::string>().empty())
    throw ChannelError("open channel: response has no next_continuation_token",
                       res.status, res.body);

  std::int64_t committed = 0;
  if (j.contains("channel_status") && j["channel_status"].is_object()) {
    const auto &st = j["channel_status"];
    if (st.contains("last_committed_offset_token"))
      committed = parse_offset(st["last_committed_offset_token"]);
  }

  continuation_ = j["next_continuation_token"].get<std::string>();
  offset_ = committed;
  state_ = ChannelState::Open;

  log_info("CHAN", "channel opened, continuation_token: " + continuation_);
  log_info("CHAN", "initial offset: " + std::to_string(offset_));
}

AppendResult ChannelSession::append(const std::vector<Record> &records) {
  if (records.empty())
    return {};
  if (state_ != ChannelState::Open)
    throw ChannelError(std::string("append: session is ") + to_string(state_), 0,
                       "");
  if (append_in_flight_.exchange(true))
    throw ChannelError("append: another append is in flight on " + name_, 0, "");
  InFlightGuard guard(append_in_flight_);

  const std::int64_t next_offset = offset_ + 1;
  const std::string payload = to_ndjson(records);
  log_dbg("CHAN", "appending " + std::to_string(records.size()) +
                      " rows, offsetToken=" + std::to_string(next_offset));

  const std::string token = creds_.scoped_token();
  const std::string &host = creds_.ingest_host();

  HttpRequest req;
  req.method = "POST";
  req.url = "https://" + host + "/v2/streaming/data/databases/" +
            url_encode(cfg_.database) + "/schemas/" + url_encode(cfg_.schema) +
            "/pipes/" + url_encode(cfg_.pipe) + "/channels/" + url_encode(name_) +
            "/rows?" +
            form_encode({{"continuationToken", continuation_},
                         {"offsetToken", std::to_string(next_offset)}});
  req.headers = {{"Authorization", "Bearer " + token},
                 {"Content-Type", "application/x-ndjson"}};
  req.body = payload;

  HttpResponse res;
  try {
    res = send(req, "append");
  } catch (const ChannelError &e) {
    log_err("CHAN", std::string(e.what()) + " - " + e.body());
    throw;
  }

  const json j = parse_body(res, "append");
  if (!j.is_object() || !j.contains("next_continuation_token") ||
      !j["next_continuation_token"].is_string() ||
      j["next_continuation_token"].get<std::string>().empty())
    throw ChannelError("append: response has no next_continuation_token",
                       res.status, res.body);

  // фиксируем состояние только после подтверждения сервером
  continuation_ = j["next_continuation_token"].get<std::string>();
  offset_ = next_offset;
  stats_.record_batch(records.size(), payload.size());

  log_info("CHAN", "appended " + std::to_string(records.size()) +
                       " rows, offset: " + std::to_string(offset_));

  AppendResult out;
  out.rows = records.size();
  out.bytes = payload.size();
  out.offset = offset_;
  return out;
}

ChannelStatus ChannelSession::get_status() {
  const std::string token = creds_.scoped_token();
  const std::string &host = creds_.ingest_host();

  HttpRequest req;
  req.method = "POST";
  req.url = pipe_path(host) + ":bulk-channel-status";
  req.headers = {{"Authorization", "Bearer " + token},
                 {"Content-Type", "application/json"}};
  req.body = json{{"channel_names", json::array({name_})}}.dump();

  const HttpResponse res = send(req, "channel status");
  const json j = parse_body(res, "channel status");

  const json *statuses = &j;
  if (j.is_object() && j.contains("channel_statuses"))
    statuses = &j["channel_statuses"];

  ChannelStatus out;
  if (statuses->is_object() && statuses->contains(name_)) {
    const json &st = (*statuses)[name_];
    out.raw = st.dump();
    if (st.is_object() && st.contains("committed_offset_token"))
      out.committed_offset = parse_offset(st["committed_offset_token"]);
  }
  return out;
}

bool ChannelSession::wait_for_commit(std::int64_t expected_offset,
                                     std::chrono::milliseconds timeout,
                                     std::chrono::milliseconds poll_interval) {
  log_info("CHAN", "waiting for offset " + std::to_string(expected_offset) +
                       " to commit...");
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    try {
      const ChannelStatus st = get_status();
      if (st.committed_offset >= expected_offset) {
        log_info("CHAN", "committed at offset " + std::to_string(st.committed_offset));
        return true;
      }
    } catch (const std::exception &e) {
      log_warn("CHAN", std::string("status check error: ") + e.what());
    }
    sleeper_(poll_interval);
  }

  log_warn("CHAN", "commit timeout after " + std::to_string(timeout.count()) + "ms");
  return false;
}

void ChannelSession::close() {
  if (state_ == ChannelState::Closed)
    return;
  state_ = ChannelState::Closed;
  log_info("CHAN", "closing channel " + name_ +
                       " (the service closes it after inactivity)");
}

} // namespace sensestream
