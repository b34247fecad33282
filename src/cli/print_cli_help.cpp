// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: ndflow [options] <command> [args]\n\n"
      << "Commands:\n"
      << "  cat <address>              Read records from an address to stdout\n"
      << "  put <address>              Write records from stdin to an address\n"
      << "  run <input> <output>       Convert one address into another\n"
      << "      [--filter <address>]...  (through filter plugins)\n"
      << "  filter <address> [args]    Pass stdin records through a filter plugin\n"
      << "  head [-n N] [address]      First N records\n"
      << "  tail [-n N] [address]      Last N records\n"
      << "  explain <address> [--write|--filter]\n"
      << "                             Show the resolved plan without running it\n"
      << "  plugins [--json]           List discovered plugins\n"
      << "  config [--write [path]]    Print or save the effective configuration\n"
      << "  help [command]             Show help for a command\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -v, --verbose              Print stages, plugin discovery and stderr\n"
      << "      --home <dir>           ndflow home (default $NDFLOW_HOME or\n"
      << "                             $XDG_CONFIG_HOME/ndflow)\n"
      << "      --config <file>        Use a specific configuration file\n\n"
      << "Addresses: base[~format[.variant]][?key=value&...]\n"
      << "  data.csv, data.csv.gz, https://host/file.json, @api/source,\n"
      << "  @plugin?k=v, '-~csv' (stdin/stdout in a given format)\n"
      << std::endl;
}
