// ndflow kernel: stage validation and the per-stage state machine
#include "kernel/pipeline_stage.hpp"

#include <sys/wait.h>

namespace nf {

const char* stage_role_name(StageRole role) {
  switch (role) {
    case StageRole::Source: return "source";
    case StageRole::Filter: return "filter";
    case StageRole::Target: return "target";
  }
  return "filter";
}

const char* endpoint_kind_name(Endpoint::Kind kind) {
  switch (kind) {
    case Endpoint::Kind::Inherit: return "inherit";
    case Endpoint::Kind::Null: return "null";
    case Endpoint::Kind::File: return "file";
    case Endpoint::Kind::Literal: return "literal";
    case Endpoint::Kind::Capture: return "capture";
    case Endpoint::Kind::Pipe: return "pipe";
  }
  return "pipe";
}

void StageStatus::mark_running(pid_t child) {
  if (state != StageState::NotStarted) {
    throw FlowError(FlowErrc::InvalidPipeline, "Stage '" + name + "' started twice");
  }
  state = StageState::Running;
  pid = child;
}

void StageStatus::release_upstream() {
  if (state == StageState::NotStarted) {
    throw FlowError(FlowErrc::InvalidPipeline,
                    "Stage '" + name + "' released before it was started");
  }
  upstream_released = true;
}

void StageStatus::mark_exited(int wait_status) {
  if (state != StageState::Running) {
    throw FlowError(FlowErrc::InvalidPipeline, "Stage '" + name + "' is not running");
  }
  state = StageState::Exited;
  if (WIFSIGNALED(wait_status)) {
    term_signal = WTERMSIG(wait_status);
    exit_code = 128 + term_signal;
  } else if (WIFEXITED(wait_status)) {
    exit_code = WEXITSTATUS(wait_status);
  }
}

void validate_pipeline(const std::vector<PipelineStage>& stages) {
  if (stages.empty()) throw FlowError(FlowErrc::InvalidPipeline, "Pipeline has no stages");

  const std::size_t last = stages.size() - 1;
  for (std::size_t i = 0; i < stages.size(); ++i) {
    const auto& s = stages[i];
    const std::string label = "Stage " + std::to_string(i + 1) + " ('" + s.name + "')";
    if (s.argv.empty()) throw FlowError(FlowErrc::InvalidPipeline, label + " has no command");
    if (s.role == StageRole::Source && i != 0) {
      throw FlowError(FlowErrc::InvalidPipeline, label + ": a source stage must come first");
    }
    if (s.role == StageRole::Target && i != last) {
      throw FlowError(FlowErrc::InvalidPipeline, label + ": a target stage must come last");
    }

    const auto in = s.stdin_source.kind;
    if (i == 0) {
      if (in == Endpoint::Kind::Pipe || in == Endpoint::Kind::Capture) {
        throw FlowError(FlowErrc::InvalidPipeline,
                        label + ": first stage needs an external input, not " +
                            endpoint_kind_name(in));
      }
    } else if (in != Endpoint::Kind::Pipe) {
      throw FlowError(FlowErrc::InvalidPipeline,
                      label + ": only the first stage may name an input");
    }

    const auto out = s.stdout_sink.kind;
    if (i == last) {
      if (out == Endpoint::Kind::Pipe || out == Endpoint::Kind::Literal) {
        throw FlowError(FlowErrc::InvalidPipeline,
                        label + ": last stage needs an external output, not " +
                            endpoint_kind_name(out));
      }
    } else if (out != Endpoint::Kind::Pipe) {
      throw FlowError(FlowErrc::InvalidPipeline,
                      label + ": only the last stage may name an output");
    }
  }
}

}  // namespace nf
