#include <iostream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

// <input> <output> with any number of `-f/--filter <address>` in between.
// Parsed by hand: stdio addresses such as "-~csv" look like options.
static void parse_run_args(const std::vector<std::string>& args, std::vector<std::string>& positional,
                           std::vector<std::string>& filters) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-f" || a == "--filter") {
      if (i + 1 == args.size()) throw UsageError("run: " + a + " needs a filter address");
      filters.push_back(args[++i]);
    } else if (a.rfind("--filter=", 0) == 0) {
      filters.push_back(a.substr(9));
    } else {
      positional.push_back(a);
    }
  }
}

int handle_run(const std::vector<std::string>& args, nf::InteractionService& svc,
               CliConfig& config) {
  std::vector<std::string> positional;
  std::vector<std::string> filters;
  parse_run_args(args, positional, filters);
  if (positional.size() != 2) throw UsageError("run expects an input and an output address");
  report_discovery(svc, config);
  std::cout.flush();
  auto outcome = svc.cmd_run(positional[0], positional[1], nf::Endpoint::inherit(), filters);
  return report_outcome(outcome, config);
}

void print_help_run(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow run <input> <output> [-f|--filter <address>]...\n\n"
            << "Convert <input> to <output> in a single pipeline, passing the records\n"
            << "through each filter plugin in order, e.g.\n"
            << "  ndflow run data.csv data.json\n"
            << "  ndflow run data.csv out.ndjson --filter '@jq_?expr=.name'\n";
}
