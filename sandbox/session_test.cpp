#include <algorithm>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/session.hpp"

namespace {

using namespace sandbox;

using State = Session::State;

class SessionTest : public ::testing::Test {
 protected:
  SessionTest()
      : session_("s-1", config_, Session::Clock::now(),
                 std::chrono::milliseconds(1000)) {}

  proto::LanguageConfig config_;
  Session session_;
};

TEST_F(SessionTest, TestLifecycle) {
  EXPECT_EQ(session_.GetState(), State::CREATED);
  EXPECT_TRUE(session_.TransitionTo(State::PROVISIONING));
  EXPECT_TRUE(session_.TransitionTo(State::RUNNING));
  EXPECT_TRUE(session_.TransitionTo(State::COMPLETED));
  EXPECT_TRUE(IsTerminal(session_.GetState()));
  EXPECT_TRUE(session_.TransitionTo(State::REAPED));
  EXPECT_FALSE(session_.TransitionTo(State::RUNNING));
  EXPECT_STREQ(StateName(session_.GetState()), "REAPED");
}

TEST_F(SessionTest, TestProvisioningFailure) {
  EXPECT_FALSE(session_.TransitionTo(State::RUNNING));
  EXPECT_TRUE(session_.TransitionTo(State::PROVISIONING));
  EXPECT_FALSE(session_.TransitionTo(State::COMPLETED));
  EXPECT_TRUE(session_.TransitionTo(State::PROVISIONING_FAILED));
  EXPECT_FALSE(session_.TransitionTo(State::RUNNING));
  EXPECT_TRUE(session_.TransitionTo(State::REAPED));
}

TEST_F(SessionTest, TestOnlyOneTerminalStateWins) {
  ASSERT_TRUE(session_.TransitionTo(State::PROVISIONING));
  ASSERT_TRUE(session_.TransitionTo(State::RUNNING));
  std::vector<State> candidates = {State::COMPLETED, State::TIMED_OUT,
                                   State::CANCELLED, State::RUNTIME_FAILED};
  std::vector<int> won(candidates.size());
  std::vector<std::thread> threads;
  for (size_t i = 0; i < candidates.size(); i++) {
    threads.emplace_back([this, &candidates, &won, i]() {
      won[i] = session_.TransitionTo(candidates[i]);
    });
  }
  for (std::thread& thread : threads) thread.join();
  EXPECT_EQ(std::count(won.begin(), won.end(), 1), 1);
}

TEST_F(SessionTest, TestHandleAndName) {
  EXPECT_EQ(session_.ContainerName(), "coderunner-s-1");
  EXPECT_EQ(session_.ContainerRef(), "coderunner-s-1");
  EXPECT_FALSE(session_.ContainerRequested());
  session_.MarkContainerRequested();
  session_.SetHandle("abcdef");
  EXPECT_TRUE(session_.ContainerRequested());
  EXPECT_EQ(session_.ContainerRef(), "abcdef");
}

TEST_F(SessionTest, TestCancellation) {
  bool caller_gone = false;
  session_.SetCancelCheck([&caller_gone]() { return caller_gone; });
  EXPECT_FALSE(session_.Cancelled());
  caller_gone = true;
  EXPECT_TRUE(session_.Cancelled());
  caller_gone = false;
  session_.Cancel();
  EXPECT_TRUE(session_.Cancelled());
}

TEST_F(SessionTest, TestDeadline) {
  auto start = Session::Clock::now() + std::chrono::seconds(5);
  session_.ArmDeadline(start);
  EXPECT_EQ(session_.Deadline(), start + std::chrono::milliseconds(1000));
}

}  // namespace
