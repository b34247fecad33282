// ndflow kernel: process pipeline executor
#pragma once

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "kernel/pipeline_stage.hpp"

namespace nf {

// A started pipeline. Terminal output (when the last stage's sink is
// Endpoint::Capture) is consumed with next_line(); close() drops the read end
// so upstream stages see end-of-pipe; finish() waits for every stage in order.
// Destroying an unfinished run closes and reaps it. A literal input is
// written by a short-lived child of its own, reaped along with the stages.
class PipelineRun {
public:
    PipelineRun(const PipelineRun&) = delete;
    PipelineRun& operator=(const PipelineRun&) = delete;
    PipelineRun(PipelineRun&& other) noexcept;
    PipelineRun& operator=(PipelineRun&& other) noexcept;
    ~PipelineRun();

    // Next line of terminal output without its newline; nullopt at end of
    // stream or after close().
    std::optional<std::string> next_line();
    void close();
    PipelineResult finish();

    bool finished() const { return finished_; }
    std::vector<pid_t> pids() const;
    const std::vector<StageStatus>& statuses() const { return statuses_; }

private:
    friend class PipelineExecutor;
    PipelineRun() = default;

    void reap() noexcept;
    void wait_children() noexcept;
    bool fill_buffer();

    std::vector<StageStatus> statuses_;
    std::vector<std::FILE*> stderr_files_;
    int capture_fd_ = -1;
    pid_t feeder_pid_ = -1;  // writer child for a literal input
    std::string buffer_;
    bool eof_ = false;
    bool finished_ = false;
    PipelineResult result_;
};

class PipelineExecutor {
public:
    // Spawn every stage and wire the streams. Throws FlowError on an invalid
    // stage list or when a file endpoint cannot be opened; stages that were
    // already started are reaped before the exception leaves.
    PipelineRun start(const std::vector<PipelineStage>& stages) const;

    // start() + drain captured output into `lines` + finish().
    PipelineResult run(const std::vector<PipelineStage>& stages) const;
};

// Run `stages` and return the aggregate exit code (0 or 1).
int execute(const std::vector<PipelineStage>& stages);

}  // namespace nf
