#include "kernel/services/pipeline_planner.hpp"

#include <nlohmann/json.hpp>

namespace nf {

namespace {

PlannedStage stage_from(const PluginMetadata& plugin, Mode mode) {
  PlannedStage s;
  s.plugin_name = plugin.name;
  s.plugin_path = plugin.path;
  s.mode = mode;
  return s;
}

}  // namespace

std::vector<PlannedStage> PipelinePlanner::plan(const Address& address, Mode mode,
                                                std::vector<std::string>* warnings) const {
  if (mode == Mode::Read && address.kind == AddressKind::Stdio && !address.format_override) {
    return {};
  }
  if (mode == Mode::Write && address.compression) {
    resolver_.fail("Writing compressed output is not supported: " + address.full_base());
  }
  if (mode == Mode::Filter && address.compression) {
    resolver_.fail("A compressed address cannot name a filter: " + address.raw);
  }

  std::vector<PlannedStage> stages;

  if (mode == Mode::Read && address.kind == AddressKind::Protocol) {
    const PluginMetadata* proto = nullptr;
    const PluginMetadata* fmt = nullptr;
    if (address.format_override) {
      const std::string scheme = address.scheme();
      proto = resolver_.lookup(scheme);
      if (!proto && (scheme == "http" || scheme == "https")) proto = resolver_.lookup("http");
      if (!proto) resolver_.fail("Protocol plugin not found: " + scheme);
      fmt = &resolver_.find_by_format(*address.format_override);
    } else {
      auto names = resolver_.plugins().registry().plan_for_read(address.base);
      if (names.size() == 2) {
        proto = resolver_.plugins().find(names[0]);
        fmt = resolver_.plugins().find(names[1]);
      }
    }

    if (proto && fmt) {
      if (!proto->supports(Mode::Raw)) {
        resolver_.fail("Plugin '" + proto->name + "' cannot stream raw bytes for " +
                       address.full_base());
      }
      PlannedStage fetch = stage_from(*proto, Mode::Raw);
      fetch.url = address.full_base();
      PlannedStage parse = stage_from(*fmt, Mode::Read);
      parse.config = coerce_parameters(address.parameters);
      stages.push_back(std::move(fetch));
      stages.push_back(std::move(parse));
    }
  }

  if (stages.empty()) {
    ResolvedAddress r = resolver_.resolve(address, mode);
    PlannedStage s;
    s.plugin_name = r.plugin_name;
    s.plugin_path = r.plugin_path;
    s.mode = mode;
    s.config = std::move(r.config);
    s.url = std::move(r.url);
    s.headers = std::move(r.headers);
    if (warnings) warnings->insert(warnings->end(), r.warnings.begin(), r.warnings.end());
    stages.push_back(std::move(s));
  }

  if (mode == Mode::Read && address.compression) {
    const PluginMetadata* decomp = resolver_.lookup(*address.compression);
    if (!decomp) resolver_.fail("Decompression plugin not found: " + *address.compression);
    PlannedStage d = stage_from(*decomp, Mode::Raw);
    // Fetching stages produce the compressed bytes; otherwise the
    // decompressor reads the file itself.
    if (stages.size() >= 2 || stages.front().url) {
      stages.insert(stages.begin() + 1, std::move(d));
    } else {
      stages.insert(stages.begin(), std::move(d));
    }
  }
  return stages;
}

std::vector<std::string> build_argv(const PlannedStage& stage,
                                    const std::vector<std::string>& runner) {
  std::vector<std::string> argv(runner.begin(), runner.end());
  argv.push_back(stage.plugin_path);
  argv.push_back("--mode");
  argv.push_back(mode_name(stage.mode));
  for (const auto& [key, value] : stage.config) {
    argv.push_back("--" + key);
    argv.push_back(config_value_to_string(value));
  }
  if (stage.url) {
    if (stage.headers && !stage.headers->empty()) {
      nlohmann::json headers(*stage.headers);
      argv.push_back("--headers");
      argv.push_back(headers.dump());
    }
    argv.push_back(*stage.url);
  }
  return argv;
}

std::vector<PipelineStage> make_read_stages(const Address& address,
                                            const std::vector<PlannedStage>& plan,
                                            const std::vector<std::string>& runner) {
  std::vector<PipelineStage> out;
  for (std::size_t i = 0; i < plan.size(); ++i) {
    PipelineStage s;
    s.role = i == 0 ? StageRole::Source : StageRole::Filter;
    s.name = plan[i].plugin_name;
    s.argv = build_argv(plan[i], runner);
    s.stdin_source = Endpoint::pipe();
    s.stdout_sink = Endpoint::pipe();
    out.push_back(std::move(s));
  }
  if (!out.empty()) {
    if (plan.front().url) {
      out.front().stdin_source = Endpoint::null();
    } else if (address.kind == AddressKind::File) {
      out.front().stdin_source = Endpoint::file(address.full_base());
    } else if (address.kind == AddressKind::Stdio) {
      out.front().stdin_source = Endpoint::inherit();
    } else {
      out.front().stdin_source = Endpoint::null();
    }
  }
  return out;
}

PipelineStage make_write_stage(const Address& address, const PlannedStage& stage,
                               const std::vector<std::string>& runner) {
  PipelineStage s;
  s.role = StageRole::Target;
  s.name = stage.plugin_name;
  s.argv = build_argv(stage, runner);
  s.stdin_source = Endpoint::pipe();
  if (!stage.url && address.kind == AddressKind::File) {
    s.stdout_sink = Endpoint::file(address.full_base());
  } else {
    s.stdout_sink = Endpoint::inherit();
  }
  return s;
}

PipelineStage make_filter_stage(const PlannedStage& stage, const std::vector<std::string>& args,
                                const std::vector<std::string>& runner) {
  PipelineStage s;
  s.role = StageRole::Filter;
  s.name = stage.plugin_name;
  s.argv = build_argv(stage, runner);
  s.argv.insert(s.argv.end(), args.begin(), args.end());
  s.stdin_source = Endpoint::pipe();
  s.stdout_sink = Endpoint::pipe();
  return s;
}

}  // namespace nf
