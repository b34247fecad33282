#include <iostream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

int handle_put(const std::vector<std::string>& args, nf::InteractionService& svc,
               CliConfig& config) {
  if (args.size() != 1) throw UsageError("put expects exactly one address");
  report_discovery(svc, config);
  std::cout.flush();
  auto outcome = svc.cmd_put(args[0]);
  return report_outcome(outcome, config);
}

void print_help_put(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow put <address>\n\n"
            << "Read NDJSON records from stdin and write them to <address>.\n"
            << "Use '-~<format>' to write a format to stdout, e.g. 'ndflow put -~csv'.\n";
}
