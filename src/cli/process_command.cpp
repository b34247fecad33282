#include "cli/process_command.hpp"

#include <iostream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/print_cli_help.hpp"

int process_command(const std::vector<std::string>& line, nf::InteractionService& svc,
                    CliConfig& config) {
  if (line.empty()) {
    print_cli_help();
    return 2;
  }
  const std::string& cmd = line.front();
  const std::vector<std::string> args(line.begin() + 1, line.end());
  try {
    if (cmd == "help") {
      return handle_help(args, svc, config);
    } else if (cmd == "cat") {
      return handle_cat(args, svc, config);
    } else if (cmd == "put") {
      return handle_put(args, svc, config);
    } else if (cmd == "run") {
      return handle_run(args, svc, config);
    } else if (cmd == "filter") {
      return handle_filter(args, svc, config);
    } else if (cmd == "head") {
      return handle_head(args, svc, config);
    } else if (cmd == "tail") {
      return handle_tail(args, svc, config);
    } else if (cmd == "explain") {
      return handle_explain(args, svc, config);
    } else if (cmd == "plugins") {
      return handle_plugins(args, svc, config);
    } else if (cmd == "config") {
      return handle_config(args, svc, config);
    }
    std::cerr << "Unknown command: " << cmd
              << ". Type 'ndflow help' for a list of commands.\n";
    return 2;
  } catch (const UsageError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const nf::FlowError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
