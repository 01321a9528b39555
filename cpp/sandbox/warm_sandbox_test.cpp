#include "sandbox/warm_sandbox.hpp"
#include <functional>
#include <string>
#include <vector>
#include <kj/debug.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/errors.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

using namespace sandbox;  // NOLINT

CommandResult Ok(std::string out = "") {
  CommandResult result;
  result.out = std::move(out);
  return result;
}

CommandResult Fail(int status, std::string err = "") {
  CommandResult result;
  result.status_code = status;
  result.err = std::move(err);
  return result;
}

// Records every command and answers with handler.
class FakeRunner : public CommandRunner {
 public:
  using Handler = std::function<kj::Promise<CommandResult>(const Command&)>;

  kj::Promise<CommandResult> Run(Command command) override {
    commands.push_back(command);
    return handler(commands.back());
  }

  size_t Count(const std::string& verb) const {
    size_t count = 0;
    for (const Command& command : commands) {
      if (command.args.size() > 1 && command.args[1] == verb) count++;
    }
    return count;
  }

  Handler handler;
  std::vector<Command> commands;
};

kj::Exception Rejection(kj::Promise<void> promise, kj::WaitScope& ws) {
  kj::Maybe<kj::Exception> error;
  promise
      .then([]() { ADD_FAILURE() << "The promise did not reject"; },
            [&error](kj::Exception exc) { error = kj::mv(exc); })
      .wait(ws);
  KJ_IF_MAYBE(exc, error) { return kj::mv(*exc); }
  return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::str("no error"));
}

kj::Exception Rejection(kj::Promise<std::string> promise, kj::WaitScope& ws) {
  return Rejection(promise.then([](std::string) {}), ws);
}

class WarmSandboxTest : public ::testing::Test {
 protected:
  WarmSandboxTest() : ws_(loop_) {
    identity_.image = "judge-python";
    identity_.name = "judge-python-worker-1";
    identity_.exec_timeout = 2 * kj::SECONDS;
  }

  // A docker where the container is running and every job prints output.
  void HealthyDocker(const std::string& output) {
    runner_.handler = [output](const Command& command) {
      if (command.args[1] == "inspect") return Ok("true\n");
      return Ok(output);
    };
  }

  kj::EventLoop loop_;
  kj::WaitScope ws_;
  FakeRunner runner_;
  Identity identity_;
};

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, EnsureReadyRunning) {
  HealthyDocker("");
  WarmSandbox box(identity_, &runner_);
  box.EnsureReady().wait(ws_);
  ASSERT_EQ(runner_.commands.size(), 1);
  EXPECT_THAT(runner_.commands[0].args,
              ElementsAre("docker", "inspect", "-f", "{{.State.Running}}",
                          "judge-python-worker-1"));
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, EnsureReadyConcurrentCallsShareOneCheck) {
  std::vector<kj::Own<kj::PromiseFulfiller<CommandResult>>> pending;
  runner_.handler = [&pending](const Command&) {
    auto paf = kj::newPromiseAndFulfiller<CommandResult>();
    pending.push_back(kj::mv(paf.fulfiller));
    return kj::mv(paf.promise);
  };
  WarmSandbox box(identity_, &runner_);

  int ready = 0;
  auto builder = kj::heapArrayBuilder<kj::Promise<void>>(5);
  for (int i = 0; i < 5; i++) {
    builder.add(box.EnsureReady().then([&ready]() { ready++; }));
  }
  auto all = kj::joinPromises(builder.finish());
  ASSERT_EQ(pending.size(), 1);
  pending[0]->fulfill(Ok("true\n"));
  all.wait(ws_);

  EXPECT_EQ(ready, 5);
  EXPECT_EQ(runner_.Count("inspect"), 1);
  EXPECT_EQ(runner_.Count("run"), 0);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, EnsureReadyRecreatesStoppedContainer) {
  runner_.handler = [](const Command& command) {
    if (command.args[1] == "inspect") return Ok("false\n");
    if (command.args[1] == "run") return Ok("0123abcd\n");
    return Ok();
  };
  WarmSandbox box(identity_, &runner_);
  box.EnsureReady().wait(ws_);

  ASSERT_EQ(runner_.commands.size(), 3);
  EXPECT_THAT(runner_.commands[1].args,
              ElementsAre("docker", "rm", "-f", "judge-python-worker-1"));
  EXPECT_THAT(runner_.commands[2].args,
              ElementsAreArray({"docker", "run", "-d", "--rm", "--name",
                                "judge-python-worker-1", "--entrypoint",
                                "/bin/sh", "judge-python", "-c",
                                "sleep infinity"}));
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, EnsureReadyInspectErrorMeansNotRunning) {
  runner_.handler = [](const Command& command) -> kj::Promise<CommandResult> {
    if (command.args[1] == "inspect") {
      return Fail(1, "Error: No such object: judge-python-worker-1");
    }
    if (command.args[1] == "rm") {
      return EnvironmentUnavailable("rm went wrong");
    }
    return Ok();
  };
  WarmSandbox box(identity_, &runner_);
  box.EnsureReady().wait(ws_);
  EXPECT_EQ(runner_.Count("rm"), 1);
  EXPECT_EQ(runner_.Count("run"), 1);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, EnsureReadyCreationFailure) {
  runner_.handler = [](const Command& command) {
    if (command.args[1] == "inspect") return Ok("false\n");
    if (command.args[1] == "run") {
      return Fail(125, "Unable to find image 'judge-python:latest' locally\n");
    }
    return Ok();
  };
  WarmSandbox box(identity_, &runner_);

  kj::Exception first = Rejection(box.EnsureReady(), ws_);
  EXPECT_TRUE(IsEnvironmentUnavailable(first));
  EXPECT_EQ(std::string(first.getDescription().cStr()),
            "Unable to find image 'judge-python:latest' locally");

  // The failed check is not cached.
  kj::Exception second = Rejection(box.EnsureReady(), ws_);
  EXPECT_TRUE(IsEnvironmentUnavailable(second));
  EXPECT_EQ(runner_.Count("inspect"), 2);
  EXPECT_EQ(runner_.Count("run"), 2);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, EnsureReadyMissingDocker) {
  runner_.handler = [](const Command&) -> kj::Promise<CommandResult> {
    return EnvironmentUnavailable("docker: exec: No such file or directory");
  };
  WarmSandbox box(identity_, &runner_);
  kj::Exception exc = Rejection(box.EnsureReady(), ws_);
  EXPECT_TRUE(IsEnvironmentUnavailable(exc));
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, EnsureReadyRecoversFromSynchronousThrow) {
  HealthyDocker("");
  WarmSandbox box(identity_, &runner_);
  box.EnsureReady().wait(ws_);

  // The runner cannot even start the inspect, e.g. out of file descriptors.
  runner_.handler = [](const Command&) -> kj::Promise<CommandResult> {
    kj::throwFatalException(KJ_EXCEPTION(FAILED, "pipe2: too many open files"));
  };
  kj::Exception exc = Rejection(box.EnsureReady(), ws_);
  EXPECT_TRUE(IsExecutionFailed(exc));

  // Meanwhile the container went away: the next check must notice.
  runner_.commands.clear();
  runner_.handler = [](const Command& command) {
    if (command.args[1] == "inspect") return Ok("false\n");
    return Ok();
  };
  box.EnsureReady().wait(ws_);
  EXPECT_EQ(runner_.Count("inspect"), 1);
  EXPECT_EQ(runner_.Count("rm"), 1);
  EXPECT_EQ(runner_.Count("run"), 1);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, RunReturnsRawOutput) {
  HealthyDocker("{\"results\": []}\n");
  WarmSandbox box(identity_, &runner_);
  std::string out = box.Run("{\"code\": \"x\"}").wait(ws_);

  EXPECT_EQ(out, "{\"results\": []}\n");
  ASSERT_EQ(runner_.commands.size(), 2);
  const Command& exec = runner_.commands[1];
  EXPECT_THAT(exec.args,
              ElementsAre("docker", "exec", "-i", "judge-python-worker-1",
                          "python", "/judge/run_submission.py"));
  EXPECT_EQ(exec.input, "{\"code\": \"x\"}");
  KJ_IF_MAYBE(limit, exec.wall_limit) {
    EXPECT_EQ(*limit, 2 * kj::SECONDS);
  } else {
    ADD_FAILURE() << "exec has no wall limit";
  }
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, RunFailureCarriesStderr) {
  runner_.handler = [](const Command& command) {
    if (command.args[1] == "inspect") return Ok("true\n");
    return Fail(1, "boom\n");
  };
  WarmSandbox box(identity_, &runner_);
  kj::Exception exc = Rejection(box.Run("{}"), ws_);
  EXPECT_TRUE(IsExecutionFailed(exc));
  EXPECT_EQ(std::string(exc.getDescription().cStr()), "boom");
  EXPECT_EQ(runner_.Count("exec"), 1);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, RunFailureWithoutStderr) {
  runner_.handler = [](const Command& command) {
    if (command.args[1] == "inspect") return Ok("true\n");
    return Fail(2);
  };
  WarmSandbox box(identity_, &runner_);
  kj::Exception exc = Rejection(box.Run("{}"), ws_);
  EXPECT_TRUE(IsExecutionFailed(exc));
  EXPECT_EQ(std::string(exc.getDescription().cStr()),
            "Warm sandbox exited with status 2");
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, RunTimeoutIsExecutionFailure) {
  runner_.handler = [](const Command& command) {
    if (command.args[1] == "inspect") return Ok("true\n");
    CommandResult result;
    result.signal = 9;
    result.killed = true;
    return result;
  };
  WarmSandbox box(identity_, &runner_);
  kj::Exception exc = Rejection(box.Run("{}"), ws_);
  EXPECT_TRUE(IsExecutionFailed(exc));
  EXPECT_FALSE(IsEnvironmentLost(exc));
  EXPECT_EQ(runner_.Count("exec"), 1);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, RunRecoversLostContainer) {
  bool alive = true;
  // Answer "running" to the next inspect even if the container is gone.
  bool stale = false;
  runner_.handler = [&alive, &stale](const Command& command) {
    const std::string& verb = command.args[1];
    if (verb == "inspect") {
      bool running = alive || stale;
      stale = false;
      return Ok(running ? "true\n" : "false\n");
    }
    if (verb == "run") {
      alive = true;
      return Ok("feedbeef\n");
    }
    if (verb == "exec") {
      if (!alive) {
        return Fail(1, "Error: No such container: judge-python-worker-1\n");
      }
      return Ok("done");
    }
    return Ok();
  };
  WarmSandbox box(identity_, &runner_);
  box.EnsureReady().wait(ws_);

  // Destroyed behind our back, right after the readiness check.
  alive = false;
  stale = true;
  runner_.commands.clear();

  EXPECT_EQ(box.Run("{}").wait(ws_), "done");
  EXPECT_EQ(runner_.Count("exec"), 2);
  EXPECT_EQ(runner_.Count("run"), 1);
  EXPECT_EQ(runner_.Count("inspect"), 2);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, RunRetriesOnlyOnce) {
  runner_.handler = [](const Command& command) {
    if (command.args[1] == "inspect") return Ok("true\n");
    if (command.args[1] == "exec") {
      return Fail(1, "Error: No such container: judge-python-worker-1");
    }
    return Ok();
  };
  WarmSandbox box(identity_, &runner_);
  kj::Exception exc = Rejection(box.Run("{}"), ws_);
  EXPECT_TRUE(IsEnvironmentLost(exc));
  EXPECT_EQ(runner_.Count("exec"), 2);
}

// NOLINTNEXTLINE
TEST_F(WarmSandboxTest, DisposeSwallowsErrors) {
  runner_.handler = [](const Command&) -> kj::Promise<CommandResult> {
    return EnvironmentUnavailable("docker: exec: No such file or directory");
  };
  WarmSandbox box(identity_, &runner_);
  box.Dispose().wait(ws_);
  ASSERT_EQ(runner_.commands.size(), 1);
  EXPECT_THAT(runner_.commands[0].args,
              ElementsAre("docker", "rm", "-f", "judge-python-worker-1"));

  runner_.handler = [](const Command&) {
    return kj::Promise<CommandResult>(Fail(1, "daemon not running"));
  };
  box.Dispose().wait(ws_);
}

}  // namespace
