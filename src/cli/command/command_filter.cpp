#include <iostream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

int handle_filter(const std::vector<std::string>& args, nf::InteractionService& svc,
                  CliConfig& config) {
  if (args.empty()) throw UsageError("filter expects a filter address");
  const std::vector<std::string> extra(args.begin() + 1, args.end());
  report_discovery(svc, config);
  std::cout.flush();
  auto outcome = svc.cmd_filter(args[0], extra, std::cout);
  return report_outcome(outcome, config);
}

void print_help_filter(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow filter <@plugin[?key=value...]> [args...]\n\n"
            << "Pass NDJSON records from stdin through a filter plugin to stdout.\n"
            << "Arguments after the address are handed to the plugin unchanged.\n"
            << "Example:\n"
            << "  ndflow cat data.csv | ndflow filter @jq_ 'select(.age > 25)'\n";
}
