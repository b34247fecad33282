#include <algorithm>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

int handle_plugins(const std::vector<std::string>& args, nf::InteractionService& svc,
                   CliConfig& config) {
  bool as_json = false;
  for (const auto& a : args) {
    if (a == "--json") {
      as_json = true;
    } else {
      throw UsageError("plugins: unexpected argument '" + a + "'");
    }
  }
  report_discovery(svc, config);
  const nf::PluginMap& plugins = svc.cmd_plugins();

  if (as_json) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, meta] : plugins) {
      std::vector<std::string> modes;
      for (nf::Mode m : {nf::Mode::Read, nf::Mode::Write, nf::Mode::Raw, nf::Mode::Filter}) {
        if (meta.supports(m)) modes.push_back(nf::mode_name(m));
      }
      out[name] = {{"path", meta.path},
                   {"role", nf::role_name(meta.role)},
                   {"matches", meta.matches},
                   {"modes", modes}};
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
  }

  if (plugins.empty()) {
    std::cout << "No plugins found.\n";
    return 0;
  }
  std::size_t width = 4;
  for (const auto& kv : plugins) width = std::max(width, kv.first.size());
  for (const auto& [name, meta] : plugins) {
    std::cout << std::left << std::setw(static_cast<int>(width) + 2) << name
              << std::setw(10) << nf::role_name(meta.role);
    for (std::size_t i = 0; i < meta.matches.size(); ++i) {
      std::cout << (i ? " " : "") << meta.matches[i];
    }
    std::cout << "\n";
  }
  return 0;
}

void print_help_plugins(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow plugins [--json]\n\n"
            << "List discovered plugins with their role and match patterns.\n"
            << "Built-in plugins are overridden by user plugins of the same name.\n";
}
