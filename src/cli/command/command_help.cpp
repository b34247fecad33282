#include <iostream>
#include <string>

#include "cli/command/commands.hpp"
#include "cli/print_cli_help.hpp"

// Dispatcher for printing specific command help
static bool dispatch_print(const std::string& cmd, const CliConfig& config) {
  if (cmd == "help") {
    print_help_help(config);
  } else if (cmd == "cat") {
    print_help_cat(config);
  } else if (cmd == "put") {
    print_help_put(config);
  } else if (cmd == "run") {
    print_help_run(config);
  } else if (cmd == "filter") {
    print_help_filter(config);
  } else if (cmd == "head") {
    print_help_head(config);
  } else if (cmd == "tail") {
    print_help_tail(config);
  } else if (cmd == "explain") {
    print_help_explain(config);
  } else if (cmd == "plugins") {
    print_help_plugins(config);
  } else if (cmd == "config") {
    print_help_config(config);
  } else {
    return false;
  }
  return true;
}

int handle_help(const std::vector<std::string>& args, nf::InteractionService& /*svc*/,
                CliConfig& config) {
  if (args.empty()) {
    print_cli_help();
    return 0;
  }
  if (!dispatch_print(args.front(), config)) {
    std::cerr << "Unknown command: " << args.front() << "\n";
    print_cli_help();
    return 2;
  }
  return 0;
}

void print_help_help(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow help [command]\n\n"
            << "Show general usage, or detailed help for one command.\n";
}
