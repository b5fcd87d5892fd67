#include "test_support.hpp"

#include <sensestream/log.hpp>

#include <cstdio>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>

using sensestream::LogLevel;
namespace t = sensestream::test;

namespace {

std::string slurp(const std::string &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

TEST(Log, FileSinkGetsLinesAboveLevel) {
  const std::string path = t::temp_path("log_sink.log");
  std::remove(path.c_str());

  ASSERT_TRUE(sensestream::open_log_file(path));
  sensestream::set_log_level(LogLevel::Warn);
  sensestream::log_info("TEST", "quiet line");
  sensestream::log_warn("TEST", "loud line");
  sensestream::set_log_level(LogLevel::Info);
  sensestream::close_log_file();

  const std::string text = slurp(path);
  EXPECT_EQ(text.find("quiet line"), std::string::npos);
  EXPECT_NE(text.find("[WARN] TEST - loud line"), std::string::npos);

  // после закрытия файл больше не пишется
  sensestream::log_warn("TEST", "after close");
  EXPECT_EQ(slurp(path).find("after close"), std::string::npos);
  std::remove(path.c_str());
}

TEST(Log, UnopenableFileKeepsStderr) {
  EXPECT_FALSE(sensestream::open_log_file("/nonexistent-dir/sensestream.log"));
}

TEST(LogDeathTest, TerminateIsLogged) {
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  EXPECT_DEATH(
      {
        sensestream::install_terminate_handler();
        std::terminate();
      },
      "FATAL - std::terminate: no active exception");
}
