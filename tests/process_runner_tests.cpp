#include <gtest/gtest.h>

#include <chrono>

#include "../libniclean/include/process_runner.hpp"
#include "test_helpers.hpp"

using namespace niclean;

class ProcessRunnerTest : public TempDirTest {};

TEST_F(ProcessRunnerTest, CapturesOutputAndExitCode) {
  const auto script = write_script(tools_dir / "echo_args", "echo \"$1-$2\"\necho oops >&2\nexit 3\n");

  const auto res = ProcessRunner::run(script, {"a b", "c"}, std::chrono::seconds(10));
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_FALSE(res.succeeded());
  EXPECT_NE(res.output.find("a b-c"), std::string::npos);
  EXPECT_NE(res.output.find("oops"), std::string::npos);
}

TEST_F(ProcessRunnerTest, ArgumentsAreNotInterpretedByAShell) {
  const auto target = input_dir / "untouched.txt";
  write_file(target, "keep");
  const auto script = write_script(tools_dir / "print_arg", "printf '%s' \"$1\"\n");

  const auto res = ProcessRunner::run(script, {"; rm " + target.string()}, std::chrono::seconds(10));
  EXPECT_TRUE(res.succeeded());
  EXPECT_EQ(res.output, "; rm " + target.string());
  EXPECT_TRUE(fs::exists(target));
}

TEST_F(ProcessRunnerTest, TimeoutKillsTheProcess) {
  const auto script = write_script(tools_dir / "sleeper", "exec sleep 30\n");

  const auto start = std::chrono::steady_clock::now();
  const auto res = ProcessRunner::run(script, {}, std::chrono::milliseconds(300));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(res.timed_out);
  EXPECT_FALSE(res.succeeded());
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(ProcessRunnerTest, HugeTimeoutDoesNotExpireImmediately) {
  const auto script = write_script(tools_dir / "quick", "echo done\n");

  const auto res = ProcessRunner::run(script, {}, std::chrono::milliseconds::max());
  EXPECT_FALSE(res.timed_out);
  EXPECT_TRUE(res.succeeded());
}

TEST_F(ProcessRunnerTest, MissingExecutableExits127) {
  const auto res = ProcessRunner::run(tools_dir / "does-not-exist", {}, std::chrono::seconds(5));
  EXPECT_EQ(res.exit_code, 127);
}

TEST_F(ProcessRunnerTest, StdinIsEmpty) {
  const auto script = write_script(tools_dir / "reader", "cat\necho done\n");

  const auto res = ProcessRunner::run(script, {}, std::chrono::seconds(10));
  EXPECT_TRUE(res.succeeded());
  EXPECT_EQ(res.output, "done\n");
}
