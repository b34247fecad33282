#include <iostream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

int handle_cat(const std::vector<std::string>& args, nf::InteractionService& svc,
               CliConfig& config) {
  if (args.size() != 1) throw UsageError("cat expects exactly one address");
  report_discovery(svc, config);
  std::cout.flush();
  auto outcome = svc.cmd_cat(args[0], std::cin, std::cout);
  return report_outcome(outcome, config);
}

void print_help_cat(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow cat <address>\n\n"
            << "Read records from <address> and write them to stdout as NDJSON.\n"
            << "Examples:\n"
            << "  ndflow cat data.csv\n"
            << "  ndflow cat 'data.txt?delimiter=;'\n"
            << "  ndflow cat https://example.com/data.json.gz\n"
            << "  ndflow cat @github/repos?owner=me\n"
            << "  ndflow cat -~csv < data.csv\n";
}
