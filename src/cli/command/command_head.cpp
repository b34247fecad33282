#include <getopt.h>
#include <iostream>
#include <utility>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

// Shared by head and tail: [-n N] [address]
static std::pair<std::size_t, std::string> parse_bounded_args(const char* name,
                                                              const std::vector<std::string>& args,
                                                              const CliConfig& config) {
  std::size_t n = static_cast<std::size_t>(config.default_head_lines);
  // Stdio addresses ("-~csv") look like options; end option parsing there.
  std::vector<std::string> normalized;
  for (const auto& a : args) {
    if (a.rfind("-~", 0) == 0 || a.rfind("-?", 0) == 0) normalized.push_back("--");
    normalized.push_back(a);
  }
  ArgvBuffer buf(name, normalized);
  const option long_opts[] = {{"lines", required_argument, nullptr, 'n'},
                              {nullptr, 0, nullptr, 0}};
  optind = 0;
  opterr = 0;
  int opt;
  while ((opt = getopt_long(buf.argc(), buf.argv(), "+n:", long_opts, nullptr)) != -1) {
    if (opt == 'n') {
      n = parse_count(optarg);
    } else {
      throw UsageError(std::string(name) + ": unknown option or missing value");
    }
  }
  std::vector<std::string> rest(buf.argv() + optind, buf.argv() + buf.argc());
  if (rest.size() > 1) throw UsageError(std::string(name) + " takes at most one address");
  return {n, rest.empty() ? std::string() : rest.front()};
}

int handle_head(const std::vector<std::string>& args, nf::InteractionService& svc,
                CliConfig& config) {
  auto [n, address] = parse_bounded_args("head", args, config);
  report_discovery(svc, config);
  auto outcome = svc.cmd_head(address, n, std::cin, std::cout);
  return report_outcome(outcome, config);
}

int handle_tail(const std::vector<std::string>& args, nf::InteractionService& svc,
                CliConfig& config) {
  auto [n, address] = parse_bounded_args("tail", args, config);
  report_discovery(svc, config);
  auto outcome = svc.cmd_tail(address, n, std::cin, std::cout);
  return report_outcome(outcome, config);
}

void print_help_head(const CliConfig& config) {
  std::cout << "Usage: ndflow head [-n N] [address]\n\n"
            << "Print the first N records (default " << config.default_head_lines << ").\n"
            << "Without an address, records are read from stdin. With one, the\n"
            << "pipeline is stopped as soon as N records have been printed.\n";
}

void print_help_tail(const CliConfig& config) {
  std::cout << "Usage: ndflow tail [-n N] [address]\n\n"
            << "Print the last N records (default " << config.default_head_lines << ").\n"
            << "Without an address, records are read from stdin.\n";
}
