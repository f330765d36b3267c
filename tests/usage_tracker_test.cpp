#include "agentgraph/recovery/usage_tracker.hpp"

#include "gtest/gtest.h"

#include <thread>
#include <vector>

using namespace agentgraph;

TEST(UsageTrackerTest, CountsRequestsTokensAndFailures) {
  UsageTracker usage;
  usage.record_request(120);
  usage.record_request(30);
  usage.record_request();
  usage.record_failure(ErrorKind::Timeout);
  usage.record_failure(ErrorKind::Timeout);
  usage.record_failure(ErrorKind::InvalidOutput);

  auto snap = usage.snapshot();
  EXPECT_EQ(snap.requests, 3);
  EXPECT_EQ(snap.total_tokens, 150);
  EXPECT_EQ(snap.failures_of(ErrorKind::Timeout), 2);
  EXPECT_EQ(snap.failures_of(ErrorKind::InvalidOutput), 1);
  EXPECT_EQ(snap.failures_of(ErrorKind::TokenLimit), 0);
  EXPECT_EQ(snap.total_failures(), 3);
}

TEST(UsageTrackerTest, JsonListsOnlyObservedFailures) {
  UsageTracker usage;
  usage.record_request(10);
  usage.record_failure(ErrorKind::TokenLimit);
  EXPECT_EQ(dump_json(usage.to_json()),
            R"({"failures":{"token_limit":1},"requests":1,"total_tokens":10})");
}

TEST(UsageTrackerTest, ResetClearsEverything) {
  UsageTracker usage;
  usage.record_request(5);
  usage.record_failure(ErrorKind::Generic);
  usage.reset();
  auto snap = usage.snapshot();
  EXPECT_EQ(snap.requests, 0);
  EXPECT_EQ(snap.total_tokens, 0);
  EXPECT_EQ(snap.total_failures(), 0);
}

TEST(UsageTrackerTest, ConcurrentRecording) {
  UsageTracker usage;
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < 8; ++t) {
      threads.emplace_back([&usage] {
        for (int i = 0; i < 1000; ++i) {
          usage.record_request(2);
        }
      });
    }
  }
  auto snap = usage.snapshot();
  EXPECT_EQ(snap.requests, 8000);
  EXPECT_EQ(snap.total_tokens, 16000);
}
