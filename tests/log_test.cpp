#include "agentgraph/util/log.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace agentgraph;
using agentgraph::test::make_temp_path;

namespace {

auto read_all(const std::string &path) -> std::string {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class LogTest : public ::testing::Test {
protected:
  void TearDown() override {
    log::set_output_stderr();
    log::set_level(log::Level::Error);
  }
};

} // namespace

TEST_F(LogTest, ParseLevelFallsBackOnUnknownName) {
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_EQ(log::parse_level("loud"), log::Level::Info);
  EXPECT_EQ(log::parse_level("loud", log::Level::Warn), log::Level::Warn);
  EXPECT_EQ(log::level_name(log::Level::Trace), "trace");
}

TEST_F(LogTest, FileSinkIsNotColored) {
  const auto path = make_temp_path("agentgraph_log_");
  ASSERT_FALSE(path.empty());
  log::set_level(log::Level::Info);
  ASSERT_TRUE(log::set_output_file(path));
  log::info("written to {}", "file");
  log::debug("below threshold");
  log::set_output_stderr();

  const auto contents = read_all(path);
  EXPECT_NE(contents.find("[info]"), std::string::npos);
  EXPECT_NE(contents.find("written to file"), std::string::npos);
  EXPECT_EQ(contents.find("below threshold"), std::string::npos);
  EXPECT_EQ(contents.find('\x1b'), std::string::npos);
  std::remove(path.c_str());
}

TEST_F(LogTest, SinkCanChangeWhileOtherThreadsLog) {
  const auto path = make_temp_path("agentgraph_log_");
  ASSERT_FALSE(path.empty());
  log::set_level(log::Level::Error);

  std::vector<std::thread> writers;
  for (int i = 0; i < 4; ++i) {
    writers.emplace_back([i] {
      for (int n = 0; n < 200; ++n) {
        log::error("writer {} line {}", i, n);
      }
    });
  }
  for (int i = 0; i < 50; ++i) {
    EXPECT_TRUE(log::set_output_file(path));
    log::set_output_stderr();
  }
  for (auto &t : writers) {
    t.join();
  }

  ASSERT_TRUE(log::set_output_file(path));
  log::error("final line");
  log::set_output_stderr();
  const auto contents = read_all(path);
  EXPECT_NE(contents.find("[error] ["), std::string::npos);
  EXPECT_NE(contents.find("final line"), std::string::npos);
  std::remove(path.c_str());
}
