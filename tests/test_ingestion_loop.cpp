#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <sensestream/cancellation.hpp>
#include <sensestream/ingestion_loop.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

using nlohmann::json;
using sensestream::HttpRequest;
using sensestream::HttpResponse;
using sensestream::IngestionLoop;
using sensestream::LoopOptions;
using sensestream::Record;
namespace t = sensestream::test;

namespace {

class ScriptedSource : public sensestream::ReadingSource {
public:
  Record read() override {
    ++reads;
    if (throw_every && reads % throw_every == 0)
      throw std::runtime_error("i2c read failed");
    Record r;
    r.set("uuid", "reading_" + std::to_string(reads));
    if (reads == bad_utf8_at)
      r.set("hostname", "pi\xff\xfe");
    else if (!(drop_hostname_every && reads % drop_hostname_every == 0))
      r.set("hostname", "pi");
    r.set("ts", static_cast<std::int64_t>(reads));
    return r;
  }

  int reads = 0;
  int throw_every = 0;
  int drop_hostname_every = 0;
  int bad_utf8_at = 0;
};

HttpResponse rows_response(int status, const std::string &token) {
  HttpResponse r;
  r.status = status;
  r.content_type = "application/json";
  r.body = status == 200 ? json{{"next_continuation_token", token}}.dump()
                         : R"({"message":"rejected"})";
  return r;
}

class IngestionLoopTest : public ::testing::Test {
protected:
  IngestionLoopTest()
      : cfg_(t::pat_config()), creds_(cfg_, http_),
        session_(cfg_, creds_, http_, stats_, 1'730'000'000,
                 [](std::chrono::milliseconds) {}) {
    t::script_control_plane(http_);
    http_.reply("PUT", "/channels/", 200, R"({"next_continuation_token":"ct-0"})");
    // statuses_[i] is the answer to append number i+1, 200 once exhausted
    http_.on("POST", "/rows?", [this](const HttpRequest &req) {
      const std::size_t call = appends_++;
      bodies_.push_back(req.body);
      offsets_.push_back(t::query_param(req.url, "offsetToken"));
      const int status = call < statuses_.size() ? statuses_[call] : 200;
      if (on_append_)
        on_append_();
      return rows_response(status, "ct-" + std::to_string(appends_));
    });
    session_.open();

    opts_.batch_size = 3;
    opts_.batch_interval = std::chrono::milliseconds(0);
    opts_.reading_interval = std::chrono::milliseconds(0);
    opts_.retry_backoff = std::chrono::milliseconds(0);
    opts_.stats_every = 0;
  }

  IngestionLoop make_loop() {
    return IngestionLoop(source_, session_, stats_, cancel_, opts_);
  }

  sensestream::StreamConfig cfg_;
  t::FakeTransport http_;
  sensestream::IngestStats stats_;
  sensestream::CredentialProvider creds_;
  sensestream::ChannelSession session_;
  sensestream::CancellationToken cancel_;
  ScriptedSource source_;
  LoopOptions opts_;

  std::vector<int> statuses_;
  std::function<void()> on_append_;
  std::size_t appends_ = 0;
  std::vector<std::string> bodies_;
  std::vector<std::string> offsets_;
};

} // namespace

TEST_F(IngestionLoopTest, StopsAfterMaxBatches) {
  opts_.max_batches = 2;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 2u);

  EXPECT_EQ(appends_, 2u);
  EXPECT_EQ(source_.reads, 6);
  EXPECT_EQ(session_.offset(), 2);
  EXPECT_EQ(stats_.rows(), 6u);
  EXPECT_EQ(stats_.batches(), 2u);
  EXPECT_EQ(stats_.errors(), 0u);
}

TEST_F(IngestionLoopTest, RejectedBatchIsCountedAndLoopContinues) {
  statuses_ = {400};
  opts_.max_batches = 3;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 2u);

  EXPECT_EQ(loop.batches_sent(), 2u);
  EXPECT_EQ(loop.batches_dropped(), 1u);
  EXPECT_EQ(stats_.errors(), 1u);
  EXPECT_EQ(stats_.batches(), 2u);
  EXPECT_EQ(session_.offset(), 2);
  // отклонённый батч не сдвигает offset
  EXPECT_EQ(offsets_, (std::vector<std::string>{"1", "1", "2"}));
}

TEST_F(IngestionLoopTest, ClientErrorsAreNotRetried) {
  statuses_ = {400, 400, 400, 400};
  opts_.max_batches = 1;
  opts_.append_retries = 3;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 0u);

  EXPECT_EQ(appends_, 1u);
  EXPECT_EQ(loop.batches_dropped(), 1u);
  EXPECT_EQ(stats_.errors(), 1u);
  EXPECT_EQ(session_.offset(), 0);
}

TEST_F(IngestionLoopTest, TransientErrorsAreRetried) {
  statuses_ = {503, 429};
  opts_.max_batches = 1;
  opts_.append_retries = 2;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 1u);

  EXPECT_EQ(appends_, 3u);
  EXPECT_EQ(stats_.errors(), 2u);
  EXPECT_EQ(loop.batches_dropped(), 0u);
  EXPECT_EQ(session_.offset(), 1);
  // все попытки несут один и тот же батч и offset
  EXPECT_EQ(offsets_, (std::vector<std::string>{"1", "1", "1"}));
  EXPECT_EQ(bodies_[0], bodies_[2]);
}

TEST_F(IngestionLoopTest, RetriesExhausted) {
  statuses_ = {503, 503, 503};
  opts_.max_batches = 1;
  opts_.append_retries = 1;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 0u);

  EXPECT_EQ(appends_, 2u);
  EXPECT_EQ(stats_.errors(), 2u);
  EXPECT_EQ(loop.batches_dropped(), 1u);
  EXPECT_EQ(session_.offset(), 0);
}

TEST_F(IngestionLoopTest, NoRetriesByDefault) {
  statuses_ = {503};
  opts_.max_batches = 2;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 1u);
  EXPECT_EQ(appends_, 2u);
  EXPECT_EQ(loop.batches_dropped(), 1u);
}

TEST_F(IngestionLoopTest, InvalidReadingsAreSkipped) {
  source_.drop_hostname_every = 2;
  opts_.batch_size = 4;
  opts_.max_batches = 1;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 1u);

  ASSERT_EQ(bodies_.size(), 1u);
  const auto rows = sensestream::from_ndjson(bodies_[0]);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(std::get<std::string>(rows[0].get("uuid")), "reading_1");
  EXPECT_EQ(std::get<std::string>(rows[1].get("uuid")), "reading_3");
  EXPECT_EQ(stats_.rows(), 2u);
}

TEST_F(IngestionLoopTest, SourceFailuresAreSkipped) {
  source_.throw_every = 3;
  opts_.max_batches = 1;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 1u);
  EXPECT_EQ(source_.reads, 3);
  EXPECT_EQ(stats_.rows(), 2u);
}

TEST_F(IngestionLoopTest, UnserializableBatchDoesNotStopLoop) {
  source_.bad_utf8_at = 1;
  opts_.batch_size = 1;
  opts_.max_batches = 3;
  opts_.append_retries = 2;
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 2u);

  EXPECT_EQ(source_.reads, 3);
  EXPECT_EQ(loop.batches_dropped(), 1u);
  EXPECT_EQ(stats_.errors(), 1u);
  // битый батч до сети не дошёл и не повторялся
  EXPECT_EQ(appends_, 2u);
  EXPECT_EQ(offsets_, (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(session_.offset(), 2);
}

TEST_F(IngestionLoopTest, NothingValidNothingSent) {
  source_.throw_every = 1;
  auto loop = make_loop();
  EXPECT_FALSE(loop.run_once());
  EXPECT_EQ(appends_, 0u);
  EXPECT_EQ(stats_.errors(), 0u);
}

TEST_F(IngestionLoopTest, CancelStopsUnboundedLoop) {
  opts_.max_batches = 0;
  on_append_ = [this] {
    if (appends_ == 2)
      cancel_.cancel();
  };
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 2u);
  EXPECT_EQ(appends_, 2u);
  EXPECT_EQ(session_.offset(), 2);
}

TEST_F(IngestionLoopTest, CancelledBeforeStart) {
  cancel_.cancel();
  auto loop = make_loop();
  EXPECT_EQ(loop.run(), 0u);
  EXPECT_EQ(source_.reads, 0);
  EXPECT_EQ(appends_, 0u);
}

TEST(CancellationToken, SleepInterruptedByCancel) {
  sensestream::CancellationToken token;
  EXPECT_TRUE(token.sleep_for(std::chrono::milliseconds(1)));
  token.cancel();
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.sleep_for(std::chrono::seconds(30)));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_TRUE(token.cancelled());
}
