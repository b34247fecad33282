// ndflow kernel: Interaction API implementation
#include "kernel/interaction.hpp"

#include "kernel/stream_utils.hpp"

namespace nf {

namespace {

std::string quote_arg(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"'\\$`|&;<>(){}*?") == std::string::npos) {
    return arg;
  }
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  return out + "'";
}

void describe_all(const std::vector<PipelineStage>& stages, CommandOutcome& o) {
  for (const auto& s : stages) o.stages.push_back(describe_stage(s));
}

}  // namespace

std::string describe_stage(const PipelineStage& stage) {
  std::string line = std::string("[") + stage_role_name(stage.role) + "] ";
  for (std::size_t i = 0; i < stage.argv.size(); ++i) {
    if (i) line += ' ';
    line += quote_arg(stage.argv[i]);
  }
  if (stage.stdin_source.kind == Endpoint::Kind::File) line += " < " + stage.stdin_source.path;
  if (stage.stdout_sink.kind == Endpoint::Kind::File) line += " > " + stage.stdout_sink.path;
  return line;
}

CommandOutcome InteractionService::cmd_cat(const std::string& address, std::istream& in,
                                           std::ostream& out, const Endpoint& sink) {
  CommandOutcome o;
  auto stages = kernel_.read_stages(address, &o.warnings);
  if (stages.empty()) {
    copy_lines(in, out);
    return o;
  }
  stages.back().stdout_sink = sink;
  describe_all(stages, o);
  out.flush();
  o.result = kernel_.execute(stages);
  for (const auto& line : o.result.lines) out << line << '\n';
  out.flush();
  return o;
}

CommandOutcome InteractionService::cmd_put(const std::string& address, const Endpoint& source) {
  CommandOutcome o;
  PipelineStage stage = kernel_.write_stage(address, &o.warnings);
  stage.stdin_source = source;
  std::vector<PipelineStage> stages{stage};
  describe_all(stages, o);
  o.result = kernel_.execute(stages);
  return o;
}

CommandOutcome InteractionService::cmd_run(const std::string& input, const std::string& output,
                                           const Endpoint& source,
                                           const std::vector<std::string>& filters) {
  CommandOutcome o;
  auto stages = kernel_.read_stages(input, &o.warnings);
  const bool reads_stdin = stages.empty();
  for (const auto& f : filters) stages.push_back(kernel_.filter_stage(f, {}, &o.warnings));
  stages.push_back(kernel_.write_stage(output, &o.warnings));
  if (reads_stdin || stages.front().stdin_source.kind == Endpoint::Kind::Inherit) {
    stages.front().stdin_source = source;
  }
  describe_all(stages, o);
  o.result = kernel_.execute(stages);
  return o;
}

CommandOutcome InteractionService::cmd_filter(const std::string& address,
                                              const std::vector<std::string>& args,
                                              std::ostream& out, const Endpoint& source,
                                              const Endpoint& sink) {
  CommandOutcome o;
  PipelineStage stage = kernel_.filter_stage(address, args, &o.warnings);
  stage.stdin_source = source;
  stage.stdout_sink = sink;
  std::vector<PipelineStage> stages{stage};
  describe_all(stages, o);
  out.flush();
  o.result = kernel_.execute(stages);
  for (const auto& line : o.result.lines) out << line << '\n';
  out.flush();
  return o;
}

CommandOutcome InteractionService::cmd_head(const std::string& address, std::size_t n,
                                            std::istream& in, std::ostream& out) {
  CommandOutcome o;
  std::vector<PipelineStage> stages;
  if (!address.empty()) stages = kernel_.read_stages(address, &o.warnings);
  if (stages.empty()) {
    head_lines(in, out, n);
    return o;
  }
  stages.back().stdout_sink = Endpoint::capture();
  describe_all(stages, o);

  PipelineRun run = kernel_.start(stages);
  for (std::size_t count = 0; count < n; ++count) {
    auto line = run.next_line();
    if (!line) break;
    out << *line << '\n';
  }
  out.flush();
  run.close();
  o.result = run.finish();
  return o;
}

CommandOutcome InteractionService::cmd_tail(const std::string& address, std::size_t n,
                                            std::istream& in, std::ostream& out) {
  CommandOutcome o;
  std::vector<PipelineStage> stages;
  if (!address.empty()) stages = kernel_.read_stages(address, &o.warnings);
  if (stages.empty()) {
    tail_lines(in, out, n);
    return o;
  }
  stages.back().stdout_sink = Endpoint::capture();
  describe_all(stages, o);

  PipelineRun run = kernel_.start(stages);
  LineRing ring(n);
  while (auto line = run.next_line()) ring.push(std::move(*line));
  o.result = run.finish();
  for (const auto& l : ring.lines()) out << l << '\n';
  out.flush();
  return o;
}

}  // namespace nf
