#include <sys/wait.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/subprocess.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

using namespace util;

SubprocessOptions Shell(const std::string& script) {
  SubprocessOptions options;
  options.args = {"sh", "-c", script};
  return options;
}

Subprocess::Clock::time_point In(int64_t millis) {
  return Subprocess::Clock::now() + std::chrono::milliseconds(millis);
}

TEST(SubprocessTest, TestNoProgram) {
  SubprocessOptions options;
  options.args = {"surely-not-an-existing-program"};
  Subprocess process(options);
  std::string error_msg;
  EXPECT_FALSE(process.Start(&error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

TEST(SubprocessTest, TestExitCode) {
  SubprocessInfo info;
  std::string error_msg;
  EXPECT_TRUE(RunSubprocess(Shell("exit 15"), 5000, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
}

TEST(SubprocessTest, TestSignal) {
  SubprocessInfo info;
  std::string error_msg;
  EXPECT_TRUE(RunSubprocess(Shell("kill -9 $$"), 5000, &info, &error_msg));
  EXPECT_EQ(info.signal, 9);
  EXPECT_EQ(info.status_code, 0);
}

TEST(SubprocessTest, TestInputAndOutput) {
  SubprocessOptions options = Shell("cat; echo oops >&2");
  options.input = "hello\nworld\n";
  SubprocessInfo info;
  std::string error_msg;
  EXPECT_TRUE(RunSubprocess(options, 5000, &info, &error_msg));
  EXPECT_EQ(info.stdout_data, "hello\nworld\n");
  EXPECT_EQ(info.stderr_data, "oops\n");
  EXPECT_FALSE(info.truncated);
}

TEST(SubprocessTest, TestArgumentsAreNotInterpreted) {
  SubprocessOptions options;
  options.args = {"sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "$(id)",
                  "';"};
  SubprocessInfo info;
  std::string error_msg;
  EXPECT_TRUE(RunSubprocess(options, 5000, &info, &error_msg));
  EXPECT_EQ(info.stdout_data, "a b|$(id)|';|");
}

TEST(SubprocessTest, TestOutputLimit) {
  SubprocessOptions options =
      Shell("i=0; while [ $i -lt 1000 ]; do echo 0123456789; i=$((i+1)); "
            "done");
  options.output_limit = 100;
  SubprocessInfo info;
  std::string error_msg;
  EXPECT_TRUE(RunSubprocess(options, 5000, &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(info.stdout_data.size(), 100u);
  EXPECT_TRUE(info.truncated);
}

TEST(SubprocessTest, TestTimeout) {
  SubprocessInfo info;
  std::string error_msg;
  auto start = Subprocess::Clock::now();
  EXPECT_FALSE(RunSubprocess(Shell("sleep 10"), 100, &info, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("timed out"));
  EXPECT_LT(Subprocess::Clock::now() - start, std::chrono::seconds(5));
  EXPECT_EQ(info.signal, 9);
}

TEST(SubprocessTest, TestDeadline) {
  Subprocess process(Shell("sleep 10"));
  std::string error_msg;
  ASSERT_TRUE(process.Start(&error_msg));
  EXPECT_EQ(process.Wait(In(50)), Subprocess::WaitResult::DEADLINE);
  EXPECT_TRUE(process.Running());
  process.Kill();
  EXPECT_FALSE(process.Running());
  EXPECT_EQ(process.Info().signal, 9);
}

TEST(SubprocessTest, TestInterrupted) {
  Subprocess process(Shell("sleep 10"));
  std::string error_msg;
  ASSERT_TRUE(process.Start(&error_msg));
  int calls = 0;
  EXPECT_EQ(process.Wait(In(10000), [&calls]() { return ++calls == 3; }),
            Subprocess::WaitResult::INTERRUPTED);
  process.Kill();
}

TEST(SubprocessTest, TestKillsWholeGroup) {
  // The background child keeps stdout open; Kill must not wait for it.
  Subprocess process(Shell("sleep 10 & sleep 10"));
  std::string error_msg;
  ASSERT_TRUE(process.Start(&error_msg));
  auto start = Subprocess::Clock::now();
  process.Kill();
  EXPECT_LT(Subprocess::Clock::now() - start, std::chrono::seconds(5));
}

TEST(SubprocessTest, TestLeftoversAreKilledWhenLeaderExits) {
  // The leader exits at once, the background child keeps stdout open.
  Subprocess process(Shell("sleep 10 & echo started"));
  std::string error_msg;
  ASSERT_TRUE(process.Start(&error_msg));
  auto start = Subprocess::Clock::now();
  EXPECT_EQ(process.Wait(In(10000)), Subprocess::WaitResult::EXITED);
  EXPECT_LT(Subprocess::Clock::now() - start, std::chrono::seconds(5));
  EXPECT_EQ(process.Info().status_code, 0);
  EXPECT_EQ(process.Info().stdout_data, "started\n");
}

TEST(SubprocessTest, TestLostExitStatusIsNotSuccess) {
  Subprocess process(Shell("exit 0"));
  std::string error_msg;
  ASSERT_TRUE(process.Start(&error_msg));
  int status = 0;
  ASSERT_EQ(waitpid(process.Pid(), &status, 0), process.Pid());
  EXPECT_EQ(process.Wait(In(5000)), Subprocess::WaitResult::EXITED);
  EXPECT_EQ(process.Info().status_code, SubprocessInfo::kStatusLost);
  EXPECT_FALSE(process.Running());
}

}  // namespace
