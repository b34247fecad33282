// FILE: include/cli/command/command_utils.hpp
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_config.hpp"
#include "kernel/interaction.hpp"

// Thrown for malformed command lines; process_command maps it to exit 2.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Mutable argv view of `args` for getopt_long, with a leading program name.
class ArgvBuffer {
 public:
    ArgvBuffer(const std::string& prog, const std::vector<std::string>& args);
    ArgvBuffer(const ArgvBuffer&) = delete;
    ArgvBuffer& operator=(const ArgvBuffer&) = delete;
    int argc() const { return static_cast<int>(ptrs_.size()) - 1; }
    char** argv() { return ptrs_.data(); }

 private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

// Parse a non-negative line count ("-n 5"). Throws UsageError.
std::size_t parse_count(const std::string& text);

// Print warnings, verbose stage listing and failures; returns the exit code.
int report_outcome(const nf::CommandOutcome& outcome, const CliConfig& config);

// Discovery summary (verbose mode only).
void report_discovery(nf::InteractionService& svc, const CliConfig& config);
