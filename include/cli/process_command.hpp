// FILE: include/cli/process_command.hpp
#pragma once
#include <string>
#include <vector>

#include "cli_config.hpp"
#include "kernel/interaction.hpp"

// Run one subcommand (`args[0]` is its name). Returns the process exit code:
// 0 success, 1 resolution or execution failure, 2 usage error.
int process_command(const std::vector<std::string>& args, nf::InteractionService& svc,
                    CliConfig& config);
