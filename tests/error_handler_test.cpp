#include "agentgraph/recovery/error_handler.hpp"

#include "gtest/gtest.h"

#include <string>
#include <thread>
#include <vector>

using namespace agentgraph;

class ErrorHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    handler_.set_interrupt_hook(
        [this](const TaskError &e) { interrupts_.push_back(e.message()); });
  }

  ErrorHandler handler_;
  std::vector<std::string> interrupts_;
};

TEST_F(ErrorHandlerTest, DefaultFallbacksSuggestRecovery) {
  EXPECT_EQ(handler_.fallback(TaskError{ErrorKind::TokenLimit, "long"}),
            FallbackAction::retry(RecoveryAction::ReduceContext));
  EXPECT_EQ(handler_.fallback(TaskError{ErrorKind::Timeout, "slow"}),
            FallbackAction::retry(RecoveryAction::BackoffRetry));
  EXPECT_EQ(handler_.fallback(TaskError{ErrorKind::InvalidOutput, "junk"}),
            FallbackAction::retry(RecoveryAction::SimplifyRequest));
}

TEST_F(ErrorHandlerTest, GenericFallbackCarriesMessage) {
  auto action = handler_.fallback(TaskError{ErrorKind::Dependency, "cycle"});
  EXPECT_EQ(action.status, FallbackStatus::Error);
  EXPECT_EQ(action.action, RecoveryAction::None);
  EXPECT_EQ(action.message, "cycle");

  auto bare = handler_.fallback(TaskError{ErrorKind::Generic, ""});
  EXPECT_EQ(bare.message, "unclassified error");
}

TEST_F(ErrorHandlerTest, LastRegisteredFallbackWins) {
  handler_.register_fallback(ErrorKind::Timeout, [](const TaskError &) {
    return FallbackAction::error("first");
  });
  handler_.register_fallback(ErrorKind::Timeout, [](const TaskError &) {
    return FallbackAction::error("second");
  });
  EXPECT_EQ(handler_.fallback(TaskError{ErrorKind::Timeout, "x"}).message,
            "second");
}

TEST_F(ErrorHandlerTest, GenericRegistrationCatchesUnhandledKinds) {
  std::vector<ErrorKind> seen;
  handler_.register_handler(ErrorKind::Generic, [&seen](const TaskError &e) {
    seen.push_back(e.kind());
  });
  handler_.register_fallback(ErrorKind::Generic, [](const TaskError &) {
    return FallbackAction::retry(RecoveryAction::BackoffRetry);
  });

  handler_.handle(TaskError{ErrorKind::Configuration, "bad toml"});
  handler_.handle(TaskError{ErrorKind::Dependency, "cycle"});
  // TokenLimit keeps its own handler.
  handler_.handle(TaskError{ErrorKind::TokenLimit, "long"});

  ASSERT_EQ(seen.size(), 2);
  EXPECT_EQ(seen[0], ErrorKind::Configuration);
  EXPECT_EQ(seen[1], ErrorKind::Dependency);
  EXPECT_EQ(handler_.fallback(TaskError{ErrorKind::Configuration, "x"}),
            FallbackAction::retry(RecoveryAction::BackoffRetry));
}

TEST_F(ErrorHandlerTest, SpecificHandlerReplacesDefault) {
  int calls = 0;
  handler_.register_handler(ErrorKind::InvalidOutput,
                            [&calls](const TaskError &) { ++calls; });
  handler_.handle(TaskError{ErrorKind::InvalidOutput, "junk"});
  EXPECT_EQ(calls, 1);
}

TEST_F(ErrorHandlerTest, HandleRecordsLastError) {
  EXPECT_FALSE(handler_.last_error().has_value());
  handler_.handle(TaskError{ErrorKind::Timeout, "slow"});
  handler_.handle(TaskError{ErrorKind::Generic, "odd"});

  auto last = handler_.last_error();
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->kind(), ErrorKind::Generic);
  EXPECT_EQ(last->message(), "odd");
  EXPECT_EQ(handler_.handled_count(), 2);
}

TEST_F(ErrorHandlerTest, UserInterruptInvokesHook) {
  handler_.handle(TaskError{ErrorKind::UserInterrupt, "ctrl-c"});
  ASSERT_EQ(interrupts_.size(), 1);
  EXPECT_EQ(interrupts_[0], "ctrl-c");
}

TEST_F(ErrorHandlerTest, ConcurrentHandleIsSafe) {
  std::vector<std::jthread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < 100; ++i) {
        handler_.handle(TaskError{ErrorKind::Timeout, "slow"});
      }
    });
  }
  threads.clear();
  EXPECT_EQ(handler_.handled_count(), 400);
}

TEST(FallbackActionTest, JsonShape) {
  EXPECT_EQ(
      dump_json(FallbackAction::retry(RecoveryAction::ReduceContext).to_json()),
      R"({"action":"reduce_context","status":"retrying"})");
  EXPECT_EQ(dump_json(FallbackAction::error("gave up").to_json()),
            R"({"message":"gave up","status":"error"})");
}

TEST(FallbackActionTest, EnumNames) {
  EXPECT_EQ(to_string_view(RecoveryAction::SimplifyRequest),
            "simplify_request");
  EXPECT_EQ(parse<FallbackStatus>("retrying"), FallbackStatus::Retrying);
}
