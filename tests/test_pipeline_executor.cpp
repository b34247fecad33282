#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <sys/wait.h>

#include "kernel/pipeline_executor.hpp"
#include "test_support.hpp"

using nf::Endpoint;
using nf::PipelineStage;
using nf::StageRole;
using Strings = std::vector<std::string>;

namespace {

PipelineStage sh(const std::string& name, const std::string& script,
                 StageRole role = StageRole::Filter) {
  PipelineStage s;
  s.role = role;
  s.name = name;
  s.argv = {"/bin/sh", "-c", script};
  s.stdin_source = Endpoint::pipe();
  s.stdout_sink = Endpoint::pipe();
  return s;
}

nf::FlowErrc error_code_of(const std::vector<PipelineStage>& stages) {
  try {
    nf::validate_pipeline(stages);
  } catch (const nf::FlowError& e) {
    return e.code();
  }
  return nf::FlowErrc::Unknown;
}

}  // namespace

TEST(PipelineExecutor, ConsumerExitStopsAnEndlessProducer) {
  auto producer = sh("producer", "exec yes record", StageRole::Source);
  producer.stdin_source = Endpoint::null();
  auto consumer = sh("consumer", "head -n 3");
  consumer.stdout_sink = Endpoint::capture();

  auto begin = std::chrono::steady_clock::now();
  auto result = nf::PipelineExecutor().run({producer, consumer});
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_TRUE(result.failures.empty());
  EXPECT_EQ(result.lines, (Strings{"record", "record", "record"}));
  EXPECT_LT(elapsed, std::chrono::seconds(10));
  ASSERT_EQ(result.stages.size(), 2u);
  EXPECT_EQ(result.stages[0].state, nf::StageState::Exited);
  EXPECT_TRUE(result.stages[0].upstream_released);
}

TEST(PipelineExecutor, ThousandLinesThroughHead) {
  auto producer = sh("producer", "i=0; while [ $i -lt 1000 ]; do echo $i; i=$((i+1)); done",
                     StageRole::Source);
  producer.stdin_source = Endpoint::null();
  auto consumer = sh("consumer", "head -n 3");
  consumer.stdout_sink = Endpoint::capture();

  auto result = nf::PipelineExecutor().run({producer, consumer});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.lines, (Strings{"0", "1", "2"}));
}

TEST(PipelineExecutor, FailingStageIsReportedWithItsStderr) {
  auto first = sh("emit", "echo a", StageRole::Source);
  first.stdin_source = Endpoint::null();
  auto middle = sh("broken", "cat >/dev/null; echo boom >&2; exit 3");
  auto last = sh("sink", "cat", StageRole::Target);
  last.stdout_sink = Endpoint::capture();

  auto result = nf::PipelineExecutor().run({first, middle, last});
  EXPECT_EQ(result.exit_code, 1);
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].stage, "broken");
  EXPECT_EQ(result.failures[0].exit_code, 3);
  EXPECT_EQ(result.failures[0].term_signal, 0);
  EXPECT_EQ(result.failures[0].stderr_text, "boom\n");
  ASSERT_EQ(result.stderr_texts.size(), 3u);
  EXPECT_TRUE(result.stderr_texts[0].empty());
  EXPECT_TRUE(result.lines.empty());
}

TEST(PipelineExecutor, BrokenPipeInTheSourceDoesNotMaskAFilterFailure) {
  auto source = sh("endless", "exec yes", StageRole::Source);
  source.stdin_source = Endpoint::null();
  auto filter = sh("picky", "head -n 1 >/dev/null; echo bad >&2; exit 2");
  auto target = sh("sink", "cat", StageRole::Target);
  target.stdout_sink = Endpoint::capture();

  auto result = nf::PipelineExecutor().run({source, filter, target});
  EXPECT_EQ(result.exit_code, 1);
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].stage, "picky");
  EXPECT_EQ(result.failures[0].exit_code, 2);
  EXPECT_EQ(result.failures[0].stderr_text, "bad\n");
  ASSERT_EQ(result.stages.size(), 3u);
  EXPECT_EQ(result.stages[0].term_signal, SIGPIPE);
}

TEST(PipelineExecutor, SignalDeathIsAFailure) {
  auto stage = sh("suicide", "kill -TERM $$");
  stage.stdin_source = Endpoint::null();
  stage.stdout_sink = Endpoint::null();

  auto result = nf::PipelineExecutor().run({stage});
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].term_signal, SIGTERM);
  EXPECT_EQ(result.failures[0].exit_code, 128 + SIGTERM);
  EXPECT_EQ(result.exit_code, 1);
}

TEST(PipelineExecutor, MissingExecutableExitsWith127) {
  PipelineStage stage;
  stage.name = "ghost";
  stage.argv = {"/nonexistent/ndflow-ghost-plugin"};
  stage.stdin_source = Endpoint::null();
  stage.stdout_sink = Endpoint::null();

  auto result = nf::PipelineExecutor().run({stage});
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].exit_code, 127);
  EXPECT_NE(result.failures[0].stderr_text.find("cannot execute"), std::string::npos);
}

TEST(PipelineExecutor, LiteralInputAndUnterminatedLastLine) {
  auto stage = sh("echo", "cat; printf tail");
  stage.stdin_source = Endpoint::literal("a\nb\n");
  stage.stdout_sink = Endpoint::capture();

  auto result = nf::PipelineExecutor().run({stage});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.lines, (Strings{"a", "b", "tail"}));
}

TEST(PipelineExecutor, LargeLiteralThroughACapturedStage) {
  // Larger than the input and output pipe buffers together.
  const std::string record(1 << 20, 'x');
  auto stage = sh("copy", "exec cat");
  stage.stdin_source = Endpoint::literal(record + "\n" + record + "\n");
  stage.stdout_sink = Endpoint::capture();

  auto begin = std::chrono::steady_clock::now();
  auto result = nf::PipelineExecutor().run({stage});
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(30));
  EXPECT_EQ(result.exit_code, 0);
  ASSERT_EQ(result.lines.size(), 2u);
  EXPECT_EQ(result.lines[0], record);
  EXPECT_EQ(result.lines[1], record);
}

TEST(PipelineExecutor, LiteralLeftUnreadByAnEarlyExit) {
  std::string many;
  for (int i = 0; i < 200000; ++i) many += "line\n";
  auto stage = sh("first", "head -n 1");
  stage.stdin_source = Endpoint::literal(many);
  stage.stdout_sink = Endpoint::capture();

  auto result = nf::PipelineExecutor().run({stage});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.lines, Strings{"line"});
}

TEST(PipelineExecutor, FileEndpoints) {
  nf_test::TempDir dir;
  nf_test::write_file(dir / "in.txt", "x\ny\n");

  auto first = sh("upper", "tr a-z A-Z", StageRole::Source);
  first.stdin_source = Endpoint::file((dir / "in.txt").string());
  auto last = sh("number", "sed 's/^/> /'", StageRole::Target);
  last.stdout_sink = Endpoint::file((dir / "out.txt").string());

  EXPECT_EQ(nf::execute({first, last}), 0);
  EXPECT_EQ(nf_test::read_file(dir / "out.txt"), "> X\n> Y\n");
}

TEST(PipelineExecutor, UnopenableInputThrowsBeforeAnythingRuns) {
  auto stage = sh("cat", "cat");
  stage.stdin_source = Endpoint::file("/nonexistent/ndflow/input.txt");
  stage.stdout_sink = Endpoint::null();
  try {
    nf::PipelineExecutor().start({stage});
    FAIL() << "expected FlowError";
  } catch (const nf::FlowError& e) {
    EXPECT_EQ(e.code(), nf::FlowErrc::Io);
    EXPECT_NE(std::string(e.what()).find("input.txt"), std::string::npos);
  }
}

TEST(PipelineExecutor, FailureAfterAForkLeavesNoChildren) {
  auto source = sh("sleeper", "exec sleep 30", StageRole::Source);
  source.stdin_source = Endpoint::literal("unread\n");
  auto target = sh("cat", "cat", StageRole::Target);
  target.stdout_sink = Endpoint::file("/nonexistent/ndflow/out.txt");

  auto begin = std::chrono::steady_clock::now();
  EXPECT_THROW(nf::PipelineExecutor().start({source, target}), nf::FlowError);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
  int status = 0;
  errno = 0;
  EXPECT_EQ(::waitpid(-1, &status, WNOHANG), -1);
  EXPECT_EQ(errno, ECHILD);
}

TEST(PipelineRun, EarlyCloseEndsTheRunCleanly) {
  auto stage = sh("endless", "exec yes", StageRole::Source);
  stage.stdin_source = Endpoint::null();
  stage.stdout_sink = Endpoint::capture();

  nf::PipelineRun run = nf::PipelineExecutor().start({stage});
  ASSERT_EQ(run.pids().size(), 1u);
  auto line = run.next_line();
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(*line, "y");
  run.close();
  EXPECT_FALSE(run.next_line().has_value());

  auto result = run.finish();
  EXPECT_TRUE(run.finished());
  EXPECT_EQ(result.exit_code, 0);
  // A second finish returns the same result without waiting again.
  EXPECT_EQ(run.finish().exit_code, 0);
}

TEST(PipelineRun, ClosingTheOutputStopsEveryUpstreamStage) {
  auto producer = sh("endless", "exec yes record", StageRole::Source);
  producer.stdin_source = Endpoint::null();
  auto relay = sh("relay", "exec sed 's/^/> /'");
  relay.stdout_sink = Endpoint::capture();

  nf::PipelineRun run = nf::PipelineExecutor().start({producer, relay});
  const auto pids = run.pids();
  ASSERT_EQ(pids.size(), 2u);
  for (int i = 0; i < 3; ++i) {
    auto line = run.next_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "> record");
  }
  run.close();

  auto begin = std::chrono::steady_clock::now();
  auto result = run.finish();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
  EXPECT_EQ(result.exit_code, 0);
  for (pid_t pid : pids) {
    errno = 0;
    EXPECT_EQ(::kill(pid, 0), -1) << pid;
    EXPECT_EQ(errno, ESRCH) << pid;
  }
}

TEST(PipelineRun, DestructorReapsAnUnfinishedRun) {
  pid_t pid = -1;
  {
    auto stage = sh("endless", "exec yes");
    stage.stdin_source = Endpoint::null();
    stage.stdout_sink = Endpoint::capture();
    nf::PipelineRun run = nf::PipelineExecutor().start({stage});
    pid = run.pids().front();
    nf::PipelineRun moved = std::move(run);
    EXPECT_TRUE(run.finished());
    EXPECT_FALSE(moved.finished());
  }
  ASSERT_GT(pid, 0);
  // Already reaped: the pid is no longer our child.
  EXPECT_EQ(::waitpid(pid, nullptr, WNOHANG), -1);
}

TEST(ValidatePipeline, RejectsMalformedStageLists) {
  EXPECT_EQ(error_code_of({}), nf::FlowErrc::InvalidPipeline);

  auto ok_first = sh("a", "cat", StageRole::Source);
  ok_first.stdin_source = Endpoint::inherit();
  auto ok_last = sh("b", "cat", StageRole::Target);
  ok_last.stdout_sink = Endpoint::inherit();
  EXPECT_EQ(error_code_of({ok_first, ok_last}), nf::FlowErrc::Unknown);

  auto no_argv = ok_first;
  no_argv.argv.clear();
  EXPECT_EQ(error_code_of({no_argv, ok_last}), nf::FlowErrc::InvalidPipeline);

  auto late_source = ok_last;
  late_source.role = StageRole::Source;
  EXPECT_EQ(error_code_of({ok_first, late_source}), nf::FlowErrc::InvalidPipeline);

  auto early_target = ok_first;
  early_target.role = StageRole::Target;
  EXPECT_EQ(error_code_of({early_target, ok_last}), nf::FlowErrc::InvalidPipeline);

  auto piped_first = ok_first;
  piped_first.stdin_source = Endpoint::pipe();
  EXPECT_EQ(error_code_of({piped_first, ok_last}), nf::FlowErrc::InvalidPipeline);

  auto open_last = ok_last;
  open_last.stdout_sink = Endpoint::pipe();
  EXPECT_EQ(error_code_of({ok_first, open_last}), nf::FlowErrc::InvalidPipeline);

  auto interior_file = ok_last;
  interior_file.stdin_source = Endpoint::file("x");
  EXPECT_EQ(error_code_of({ok_first, interior_file}), nf::FlowErrc::InvalidPipeline);

  auto leaking_first = ok_first;
  leaking_first.stdout_sink = Endpoint::capture();
  EXPECT_EQ(error_code_of({leaking_first, ok_last}), nf::FlowErrc::InvalidPipeline);
}

TEST(StageStatus, TransitionsAreOrdered) {
  nf::StageStatus s;
  s.name = "x";
  EXPECT_THROW(s.release_upstream(), nf::FlowError);
  EXPECT_THROW(s.mark_exited(0), nf::FlowError);
  s.mark_running(42);
  EXPECT_EQ(s.state, nf::StageState::Running);
  EXPECT_THROW(s.mark_running(43), nf::FlowError);
  s.release_upstream();
  EXPECT_TRUE(s.upstream_released);
  s.mark_exited(0);
  EXPECT_EQ(s.state, nf::StageState::Exited);
  EXPECT_EQ(s.exit_code, 0);
}
