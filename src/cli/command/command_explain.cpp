#include <getopt.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <variant>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"

using nlohmann::json;

static json config_to_json(const nf::ConfigMap& config) {
  json out = json::object();
  for (const auto& [key, value] : config) {
    std::visit([&out, &key](const auto& v) { out[key] = v; }, value);
  }
  return out;
}

static json plan_to_json(const nf::AddressPlan& plan) {
  const nf::Address& a = plan.address;
  json address = {{"raw", a.raw},
                  {"base", a.base},
                  {"kind", nf::address_kind_name(a.kind)},
                  {"parameters", a.parameters}};
  if (a.format_override) address["format"] = *a.format_override;
  if (a.compression) address["compression"] = *a.compression;

  json stages = json::array();
  for (std::size_t i = 0; i < plan.stages.size(); ++i) {
    const auto& s = plan.stages[i];
    json stage = {{"plugin", s.plugin_name},
                  {"path", s.plugin_path},
                  {"mode", nf::mode_name(s.mode)},
                  {"config", config_to_json(s.config)},
                  {"argv", plan.argvs[i]}};
    if (s.url) stage["url"] = *s.url;
    if (s.headers) stage["headers"] = *s.headers;
    stages.push_back(stage);
  }

  json out = {{"address", address}, {"mode", nf::mode_name(plan.mode)}, {"stages", stages}};
  if (!plan.warnings.empty()) out["warnings"] = plan.warnings;
  return out;
}

int handle_explain(const std::vector<std::string>& args, nf::InteractionService& svc,
                   CliConfig& config) {
  nf::Mode mode = nf::Mode::Read;
  std::vector<std::string> positional;
  for (const auto& a : args) {
    if (a == "--write" || a == "-w") {
      mode = nf::Mode::Write;
    } else if (a == "--filter" || a == "-f") {
      mode = nf::Mode::Filter;
    } else if (a == "--read" || a == "-r") {
      mode = nf::Mode::Read;
    } else {
      positional.push_back(a);
    }
  }
  if (positional.size() != 1) throw UsageError("explain expects exactly one address");
  report_discovery(svc, config);
  nf::AddressPlan plan = svc.cmd_explain(positional.front(), mode);
  std::cout << plan_to_json(plan).dump(2) << std::endl;
  return 0;
}

void print_help_explain(const CliConfig& /*config*/) {
  std::cout << "Usage: ndflow explain <address> [--write | --filter]\n\n"
            << "Show how <address> is parsed and resolved, and the plugin command\n"
            << "lines that would run, without executing anything. The plan is\n"
            << "printed as JSON. --write plans the address as an output and\n"
            << "--filter as a filter stage.\n";
}
