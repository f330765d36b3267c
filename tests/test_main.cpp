#include "agentgraph/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);

  // Keep gtest output readable; individual tests raise the level if needed.
  agentgraph::log::set_output_stderr();
  agentgraph::log::set_level(agentgraph::log::Level::Error);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
