// ndflow kernel: Interaction API between CLI and Kernel
#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "kernel/kernel.hpp"
#include "kernel/plugin_result.hpp"

namespace nf {

// Outcome of one CLI-level operation. `result.exit_code` is what the front
// end exits with; `warnings` are non-fatal notes (e.g. unknown profile params).
struct CommandOutcome {
    PipelineResult result;
    std::vector<std::string> stages;  // stage argv lines, for verbose output
    std::vector<std::string> warnings;
};

// Minimal interaction facade to decouple frontends from Kernel internals.
// Stream arguments are used only where the engine itself moves bytes (plain
// stdin pass-through, head/tail consumption); plugin stages otherwise inherit
// the process's stdin/stdout.
class InteractionService {
public:
    explicit InteractionService(Kernel& kernel) : kernel_(kernel) {}

    // Read `address` and send its records to stdout (or `sink`).
    CommandOutcome cmd_cat(const std::string& address, std::istream& in, std::ostream& out,
                           const Endpoint& sink = Endpoint::inherit());
    // Write records from stdin (or `source`) to `address`.
    CommandOutcome cmd_put(const std::string& address,
                           const Endpoint& source = Endpoint::inherit());
    // Read `input` and write it to `output` in one pipeline, passing the
    // records through each of `filters` (filter addresses) in order.
    CommandOutcome cmd_run(const std::string& input, const std::string& output,
                           const Endpoint& source = Endpoint::inherit(),
                           const std::vector<std::string>& filters = {});
    // Run the filter plugin at `address` with extra `args` over stdin (or
    // `source`), sending its records to stdout (or `sink`).
    CommandOutcome cmd_filter(const std::string& address, const std::vector<std::string>& args,
                              std::ostream& out, const Endpoint& source = Endpoint::inherit(),
                              const Endpoint& sink = Endpoint::inherit());
    // First / last `n` records of `address`; an empty address reads `in`.
    CommandOutcome cmd_head(const std::string& address, std::size_t n, std::istream& in,
                            std::ostream& out);
    CommandOutcome cmd_tail(const std::string& address, std::size_t n, std::istream& in,
                            std::ostream& out);

    AddressPlan cmd_explain(const std::string& address, Mode mode) { return kernel_.plan(address, mode); }

    // Plugins
    const PluginMap& cmd_plugins() { return kernel_.plugins().plugins(); }
    const DiscoveryReport& cmd_plugins_report() { return kernel_.load_plugins(); }
    const std::vector<std::string>& cmd_dropped_patterns() {
        return kernel_.plugins().registry().dropped_patterns();
    }

private:
    Kernel& kernel_;
};

// One stage as a shell-like line, for verbose listings.
std::string describe_stage(const PipelineStage& stage);

} // namespace nf
