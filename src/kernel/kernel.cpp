// ndflow kernel: Kernel implementation
#include "kernel/kernel.hpp"

#include <utility>

namespace nf {

namespace {

fs::path or_default(const fs::path& value, const fs::path& fallback) {
  return value.empty() ? fallback : value;
}

}  // namespace

Kernel::Kernel(KernelOptions options) : options_(std::move(options)) {
  options_.plugin_dir = or_default(options_.plugin_dir, options_.home / "plugins");
  options_.builtin_plugin_dir =
      or_default(options_.builtin_plugin_dir, options_.home / "builtin");
  options_.cache_path = or_default(options_.cache_path, options_.home / "cache.json");
  options_.gmail_profile_dir =
      or_default(options_.gmail_profile_dir, options_.home / "profiles" / "gmail");
  if (options_.project_dir.empty()) {
    std::error_code ec;
    options_.project_dir = fs::current_path(ec);
  }

  profiles_ = std::make_unique<ProfileService>(options_.home, options_.profile_dirs,
                                               options_.gmail_profile_dir, options_.project_dir);
  resolver_ = std::make_unique<AddressResolver>(plugin_mgr_, *profiles_);
  planner_ = std::make_unique<PipelinePlanner>(*resolver_);
}

const DiscoveryReport& Kernel::load_plugins() {
  if (!discovery_) {
    discovery_ = plugin_mgr_.load(options_.plugin_dir, options_.cache_path,
                                  options_.builtin_plugin_dir);
  }
  return *discovery_;
}

void Kernel::reload_plugins() { discovery_.reset(); }

PluginManager& Kernel::plugins() {
  load_plugins();
  return plugin_mgr_;
}

const AddressResolver& Kernel::resolver() {
  load_plugins();
  return *resolver_;
}

const PipelinePlanner& Kernel::planner() {
  load_plugins();
  return *planner_;
}

AddressPlan Kernel::plan(const std::string& raw_address, Mode mode) {
  AddressPlan out;
  out.address = parse_address(raw_address);
  out.mode = mode;
  out.stages = planner().plan(out.address, mode, &out.warnings);
  for (const auto& s : out.stages) out.argvs.push_back(build_argv(s, options_.plugin_runner));
  return out;
}

std::vector<PipelineStage> Kernel::read_stages(const std::string& raw_address,
                                               std::vector<std::string>* warnings) {
  Address address = parse_address(raw_address);
  auto planned = planner().plan(address, Mode::Read, warnings);
  return make_read_stages(address, planned, options_.plugin_runner);
}

PipelineStage Kernel::write_stage(const std::string& raw_address,
                                  std::vector<std::string>* warnings) {
  Address address = parse_address(raw_address);
  auto planned = planner().plan(address, Mode::Write, warnings);
  return make_write_stage(address, planned.front(), options_.plugin_runner);
}

PipelineStage Kernel::filter_stage(const std::string& raw_address,
                                   const std::vector<std::string>& args,
                                   std::vector<std::string>* warnings) {
  Address address = parse_address(raw_address);
  auto planned = planner().plan(address, Mode::Filter, warnings);
  return make_filter_stage(planned.front(), args, options_.plugin_runner);
}

PipelineResult Kernel::execute(const std::vector<PipelineStage>& stages) const {
  return executor_.run(stages);
}

PipelineRun Kernel::start(const std::vector<PipelineStage>& stages) const {
  return executor_.start(stages);
}

}  // namespace nf
