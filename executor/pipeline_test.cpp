#include <atomic>
#include <thread>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "executor/pipeline.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/fake_runtime.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

using namespace executor;

using Files = runtime::FakeRuntime::Files;
using Program = runtime::FakeRuntime::Program;

// Emulates the run and compile commands of the languages: "program" prints
// its source followed by its input, compilation fails on sources containing
// "syntax error", and sources containing "loop" never end.
Program Interpreter(const std::string& script,
                    const std::vector<std::string>& args, const Files& files) {
  Program program;
  std::string source;
  for (const auto& kv : files) {
    if (absl::StartsWith(kv.first, "/tmp/code.") ||
        absl::StartsWith(kv.first, "/tmp/Main.")) {
      source = kv.second;
    }
  }
  std::string input = files.count("/tmp/.stdin") ? files.at("/tmp/.stdin") : "";
  bool compiling = absl::StrContains(script, "< /dev/null");
  if (absl::StrContains(source, "loop")) {
    program.hang = true;
  } else if (compiling) {
    if (absl::StrContains(source, "syntax error")) {
      program.exit_code = 1;
      program.stderr_data = "code.c:1:1: error: expected '}'\n";
    }
  } else if (absl::StrContains(source, "exit")) {
    program.exit_code = 42;
    program.stderr_data = "Traceback: exit\n";
  } else {
    program.stdout_data = source + input;
    for (const std::string& arg : args) program.stdout_data += arg;
  }
  return program;
}

class PipelineTest : public ::testing::Test {
 protected:
  PipelineTest()
      : health_(HealthOptions()),
        reaper_(&runtime_, &health_, sandbox::Reaper::Options()),
        orchestrator_(&runtime_, &health_, &reaper_, OrchestratorOptions()),
        validator_(&registry_, Validator::Options()),
        limiter_(4, 1000),
        pipeline_(&validator_, &orchestrator_, &limiter_) {
    runtime_.SetHandler(Interpreter);
  }

  static runtime::HealthMonitor::Options HealthOptions() {
    runtime::HealthMonitor::Options options;
    options.backoff_min_millis = 60 * 1000;
    options.backoff_max_millis = 60 * 1000;
    return options;
  }

  static sandbox::Orchestrator::Options OrchestratorOptions() {
    sandbox::Orchestrator::Options options;
    options.output_limit_bytes = 1024;
    return options;
  }

  static proto::ExecuteRequest Request(const std::string& language,
                                       const std::string& code,
                                       const std::string& input = "") {
    proto::ExecuteRequest request;
    request.set_language(language);
    request.set_code(code);
    request.set_input(input);
    return request;
  }

  // Waits for the reaper to remove the released containers.
  void Drain() {
    for (int i = 0; i < 1000 && reaper_.Pending() > 0; i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  void ExpectNoLeaks() {
    Drain();
    EXPECT_THAT(runtime_.Containers(), IsEmpty());
    EXPECT_EQ(orchestrator_.LiveSessions(), 0u);
    EXPECT_EQ(limiter_.Running(), 0u);
  }

  language::Registry registry_;
  runtime::FakeRuntime runtime_;
  runtime::HealthMonitor health_;
  sandbox::Reaper reaper_;
  sandbox::Orchestrator orchestrator_;
  Validator validator_;
  Limiter limiter_;
  Pipeline pipeline_;
};

TEST_F(PipelineTest, TestHelloWorld) {
  proto::ExecuteResponse response =
      pipeline_.Execute(Request("python", "print('Hello, World!')\n"));
  EXPECT_TRUE(response.success());
  EXPECT_EQ(response.output(), "print('Hello, World!')\n");
  EXPECT_TRUE(response.has_exit_code());
  EXPECT_EQ(response.exit_code(), 0);
  EXPECT_FALSE(response.timed_out());
  EXPECT_FALSE(response.truncated());
  EXPECT_EQ(response.outcome(), proto::Outcome::COMPLETED);
  EXPECT_FALSE(response.session_id().empty());
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestInputAndArguments) {
  proto::ExecuteRequest request = Request("ruby", "src|", "line\r\nlast");
  request.add_arg("A");
  request.add_arg("B");
  proto::ExecuteResponse response = pipeline_.Execute(request);
  EXPECT_EQ(response.output(), "src|line\nlast\nAB");
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestCompiledLanguage) {
  proto::ExecuteResponse response =
      pipeline_.Execute(Request("c", "int main() {}"));
  EXPECT_TRUE(response.success());
  std::vector<std::string> scripts = runtime_.Scripts();
  ASSERT_EQ(scripts.size(), 2u);
  EXPECT_THAT(scripts[0], HasSubstr("gcc"));
  EXPECT_THAT(scripts[1], HasSubstr("/tmp/program"));
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestCompileError) {
  proto::ExecuteResponse response =
      pipeline_.Execute(Request("c", "int main(){ printf(\"x\") syntax error"));
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.outcome(), proto::Outcome::COMPILE_ERROR);
  EXPECT_NE(response.exit_code(), 0);
  EXPECT_THAT(response.error(), HasSubstr("error: expected"));
  EXPECT_FALSE(response.timed_out());
  // The program is never run.
  EXPECT_EQ(runtime_.Scripts().size(), 1u);
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestRuntimeError) {
  proto::ExecuteResponse response =
      pipeline_.Execute(Request("python", "exit(42)"));
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.outcome(), proto::Outcome::RUNTIME_ERROR);
  EXPECT_EQ(response.exit_code(), 42);
  EXPECT_THAT(response.error(), HasSubstr("Traceback"));
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestTimeout) {
  proto::ExecuteRequest request = Request("python", "while True: loop");
  request.set_timeout_ms(1000);
  auto start = std::chrono::steady_clock::now();
  proto::ExecuteResponse response = pipeline_.Execute(request);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(1000));
  EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
  EXPECT_FALSE(response.success());
  EXPECT_TRUE(response.timed_out());
  EXPECT_FALSE(response.has_exit_code());
  EXPECT_EQ(response.outcome(), proto::Outcome::TIMED_OUT);
  EXPECT_THAT(response.error(), HasSubstr("timed out"));
  EXPECT_EQ(runtime_.KillCalls(), 1);
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestCancellation) {
  std::atomic<bool> gone{false};
  std::thread canceller([&gone]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    gone = true;
  });
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(pipeline_.Execute(Request("python", "loop"),
                                 [&gone]() { return gone.load(); }),
               sandbox::cancelled_error);
  canceller.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(5000));
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestCancelledWhileProvisioning) {
  EXPECT_THROW(
      pipeline_.Execute(Request("python", "print(1)"),
                        [this]() { return runtime_.CreateCalls() > 0; }),
      sandbox::cancelled_error);
  EXPECT_EQ(runtime_.CreateCalls(), 1);
  EXPECT_THAT(runtime_.Scripts(), IsEmpty());
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestResponseDoesNotWaitForRemoval) {
  runtime_.SetRemoveDelay(2000);
  auto start = std::chrono::steady_clock::now();
  proto::ExecuteResponse response =
      pipeline_.Execute(Request("python", "print(1)"));
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(1000));
  EXPECT_TRUE(response.success());
  EXPECT_EQ(orchestrator_.LiveSessions(), 0u);
  EXPECT_EQ(limiter_.Running(), 0u);
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestLostDaemonDuringRun) {
  runtime_.SetHandler([this](const std::string&,
                             const std::vector<std::string>&, const Files&) {
    runtime_.SetUnavailable(true);
    Program program;
    program.exit_code = 1;
    program.stderr_data = "Cannot connect to the Docker daemon";
    program.client_status = runtime::CallStatus::UNAVAILABLE;
    return program;
  });
  try {
    pipeline_.Execute(Request("python", "print(1)"));
    FAIL() << "The lost daemon went unnoticed";
  } catch (const sandbox::provisioning_error& e) {
    EXPECT_EQ(e.reason(), sandbox::provisioning_error::Reason::UNAVAILABLE);
  }
  EXPECT_GE(health_.Get().consecutive_failures, 1);
  for (int i = 0; i < 3 && health_.Get().is_available; i++) {
    EXPECT_THROW(pipeline_.Execute(Request("python", "print(1)")),
                 sandbox::provisioning_error);
  }
  EXPECT_FALSE(health_.Get().is_available);
  EXPECT_EQ(orchestrator_.LiveSessions(), 0u);
  EXPECT_EQ(limiter_.Running(), 0u);
}

TEST_F(PipelineTest, TestClientErrorTextFromTheProgram) {
  // The daemon still answers, so the line is the program's own output.
  runtime_.SetHandler([](const std::string&, const std::vector<std::string>&,
                         const Files&) {
    Program program;
    program.exit_code = 1;
    program.stderr_data = "Cannot connect to the Docker daemon";
    program.client_status = runtime::CallStatus::UNAVAILABLE;
    return program;
  });
  proto::ExecuteResponse response =
      pipeline_.Execute(Request("python", "print(1)"));
  EXPECT_EQ(response.outcome(), proto::Outcome::RUNTIME_ERROR);
  EXPECT_EQ(response.exit_code(), 1);
  EXPECT_TRUE(health_.Get().is_available);
  EXPECT_EQ(health_.Get().consecutive_failures, 0);
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestVanishedContainer) {
  runtime_.SetHandler([](const std::string&, const std::vector<std::string>&,
                         const Files&) {
    Program program;
    program.exit_code = 1;
    program.stderr_data = "Error response from daemon: No such container: x";
    program.client_status = runtime::CallStatus::NOT_FOUND;
    return program;
  });
  try {
    pipeline_.Execute(Request("python", "print(1)"));
    FAIL() << "Reported a client failure as program output";
  } catch (const sandbox::execution_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("No such container"));
  }
  EXPECT_TRUE(health_.Get().is_available);
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestJavaPublicClassIsRenamed) {
  std::string compiled;
  runtime_.SetHandler([&compiled](const std::string& script,
                                  const std::vector<std::string>&,
                                  const Files& files) {
    if (absl::StrContains(script, "javac") && files.count("/tmp/Main.java")) {
      compiled = files.at("/tmp/Main.java");
    }
    return Program();
  });
  proto::ExecuteResponse response = pipeline_.Execute(Request(
      "java", "public class Solution {\n  public static void main() {}\n}"));
  EXPECT_TRUE(response.success());
  EXPECT_EQ(compiled,
            "public class Main {\n  public static void main() {}\n}");
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestValidationErrorTouchesNoSandbox) {
  EXPECT_THROW(pipeline_.Execute(Request("cobol", "x")), validation_error);
  EXPECT_EQ(runtime_.CreateCalls(), 0);
  EXPECT_EQ(runtime_.PingCalls(), 0);
}

TEST_F(PipelineTest, TestUnreachableDaemonFailsFast) {
  runtime_.SetUnavailable(true);
  for (int i = 0; i < 3; i++) {
    EXPECT_THROW(pipeline_.Execute(Request("python", "x")),
                 sandbox::provisioning_error);
  }
  EXPECT_FALSE(health_.Get().is_available);
  EXPECT_EQ(health_.Get().consecutive_failures, 3);
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(pipeline_.Execute(Request("python", "x")),
               sandbox::provisioning_error);
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(100));
  EXPECT_EQ(orchestrator_.LiveSessions(), 0u);
}

TEST_F(PipelineTest, TestMissingImage) {
  runtime_.SetMissingImage(registry_.Resolve("rust").image());
  try {
    pipeline_.Execute(Request("rust", "fn main() {}"));
    FAIL() << "Executed without an image";
  } catch (const sandbox::provisioning_error& e) {
    EXPECT_EQ(e.reason(), sandbox::provisioning_error::Reason::IMAGE_MISSING);
  }
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestTruncation) {
  proto::ExecuteResponse response =
      pipeline_.Execute(Request("python", std::string(5000, 'x')));
  EXPECT_TRUE(response.success());
  EXPECT_TRUE(response.truncated());
  EXPECT_EQ(response.output().size(), 1024u);
  ExpectNoLeaks();
}

TEST_F(PipelineTest, TestConcurrentSessionsAreIsolated) {
  const std::vector<std::string> languages = {"python", "javascript", "ruby",
                                              "php", "c", "go", "java",
                                              "lua"};
  std::vector<proto::ExecuteResponse> responses(languages.size());
  std::vector<std::thread> threads;
  for (size_t i = 0; i < languages.size(); i++) {
    threads.emplace_back([this, &languages, &responses, i]() {
      responses[i] = pipeline_.Execute(
          Request(languages[i], absl::StrCat(languages[i], ":"),
                  absl::StrCat("input", i)));
    });
  }
  for (std::thread& thread : threads) thread.join();
  for (size_t i = 0; i < languages.size(); i++) {
    EXPECT_TRUE(responses[i].success()) << languages[i];
    EXPECT_EQ(responses[i].output(),
              absl::StrCat(languages[i], ":input", i, "\n"));
  }
  ExpectNoLeaks();
}

}  // namespace
