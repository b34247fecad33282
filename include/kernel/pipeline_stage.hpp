// ndflow kernel: pipeline stage description and per-stage process state
#pragma once

#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

#include "nf_types.hpp"

namespace nf {

enum class StageRole { Source, Filter, Target };

const char* stage_role_name(StageRole role);

// Where a stage's stdin comes from or its stdout goes to.
struct Endpoint {
  enum class Kind {
    Inherit,  // the engine's own stdin/stdout
    Null,     // /dev/null
    File,     // `path`, opened read-only (stdin) or truncated (stdout)
    Literal,  // `bytes` written to the stage's stdin by the engine
    Capture,  // stdout read line by line by the caller
    Pipe,     // wired to the adjacent stage
  };

  Kind kind = Kind::Pipe;
  std::string path;
  std::string bytes;

  static Endpoint inherit() { return {Kind::Inherit, {}, {}}; }
  static Endpoint null() { return {Kind::Null, {}, {}}; }
  static Endpoint file(std::string p) { return {Kind::File, std::move(p), {}}; }
  static Endpoint literal(std::string b) { return {Kind::Literal, {}, std::move(b)}; }
  static Endpoint capture() { return {Kind::Capture, {}, {}}; }
  static Endpoint pipe() { return {Kind::Pipe, {}, {}}; }
};

const char* endpoint_kind_name(Endpoint::Kind kind);

struct PipelineStage {
  StageRole role = StageRole::Filter;
  std::string name;  // shown in failure reports
  std::vector<std::string> argv;
  Endpoint stdin_source;
  Endpoint stdout_sink;
};

// NotStarted -> Running -> Exited. `upstream_released` records that the
// engine dropped its own copies of the stage's stream handles after spawning
// it, so end-of-pipe can propagate between neighbours.
enum class StageState { NotStarted, Running, Exited };

struct StageStatus {
  std::string name;
  StageState state = StageState::NotStarted;
  pid_t pid = -1;
  bool upstream_released = false;
  int exit_code = -1;   // valid when exited normally
  int term_signal = 0;  // non-zero when killed by a signal

  void mark_running(pid_t child);
  void release_upstream();
  void mark_exited(int wait_status);
};

struct StageFailure {
  std::string stage;
  int exit_code = -1;
  int term_signal = 0;
  std::string stderr_text;
};

struct PipelineResult {
  int exit_code = 0;  // 0 when every stage succeeded (or ended on SIGPIPE), 1 otherwise
  std::vector<StageFailure> failures;
  std::vector<std::string> lines;  // captured terminal output, when requested
  std::vector<StageStatus> stages;
  std::vector<std::string> stderr_texts;  // per stage, in order
};

// Check list shape: non-empty, a Source only first, a Target only last,
// interior endpoints are pipes and external endpoints only at the ends.
// Throws FlowError(FlowErrc::InvalidPipeline).
void validate_pipeline(const std::vector<PipelineStage>& stages);

}  // namespace nf
