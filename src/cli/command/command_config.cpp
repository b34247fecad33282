#include <filesystem>
#include <iostream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

int handle_config(const std::vector<std::string>& args, nf::InteractionService& /*svc*/,
                  CliConfig& config) {
  if (args.empty()) {
    if (!config.loaded_config_path.empty()) {
      std::cout << "# loaded from " << config.loaded_config_path << "\n";
    }
    std::cout << "# home: " << config.home << "\n" << config_to_yaml(config);
    return 0;
  }
  if (args.front() != "--write") throw UsageError("config: unexpected argument '" + args.front() + "'");
  if (args.size() > 2) throw UsageError("config --write takes at most one path");

  std::string path = args.size() == 2 ? args[1] : (std::filesystem::path(config.home) / "config.yaml").string();
  if (!write_config_to_file(config, path)) {
    throw nf::FlowError(nf::FlowErrc::Io, "could not write configuration to '" + path + "'");
  }
  std::cout << "Configuration written to " << path << "\n";
  return 0;
}

void print_help_config(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow config [--write [path]]\n\n"
            << "Print the effective configuration as YAML, or write it to <path>\n"
            << "(default <home>/config.yaml).\n\n"
            << "Keys: plugin_dir, builtin_plugin_dir, cache_path, profile_dirs,\n"
            << "      gmail_profile_dir, plugin_runner, default_head_lines, verbose\n";
}
