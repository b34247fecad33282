// FILE: src/cli/command/command_utils.cpp
#include "cli/command/command_utils.hpp"

#include <iostream>

ArgvBuffer::ArgvBuffer(const std::string& prog, const std::vector<std::string>& args) {
  storage_.reserve(args.size() + 1);
  storage_.push_back(prog);
  storage_.insert(storage_.end(), args.begin(), args.end());
  for (auto& s : storage_) ptrs_.push_back(s.data());
  ptrs_.push_back(nullptr);
}

std::size_t parse_count(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw UsageError("invalid line count '" + text + "'");
  }
  try {
    return static_cast<std::size_t>(std::stoull(text));
  } catch (const std::out_of_range&) {
    throw UsageError("line count out of range '" + text + "'");
  }
}

static void print_stderr_block(const std::string& text) {
  if (text.empty()) return;
  std::cerr << text;
  if (text.back() != '\n') std::cerr << '\n';
}

int report_outcome(const nf::CommandOutcome& outcome, const CliConfig& config) {
  for (const auto& w : outcome.warnings) std::cerr << "Warning: " << w << "\n";
  const auto& result = outcome.result;

  if (config.verbose) {
    for (const auto& line : outcome.stages) std::cerr << "  stage " << line << "\n";
    for (std::size_t i = 0; i < result.stderr_texts.size(); ++i) {
      if (result.stderr_texts[i].empty()) continue;
      std::string name = i < result.stages.size() ? result.stages[i].name : std::to_string(i);
      std::cerr << "--- stderr of " << name << " ---\n";
      print_stderr_block(result.stderr_texts[i]);
    }
  }

  for (const auto& f : result.failures) {
    std::cerr << "Error: stage '" << f.stage << "' failed";
    if (f.term_signal != 0) {
      std::cerr << " (signal " << f.term_signal << ")\n";
    } else {
      std::cerr << " (exit " << f.exit_code << ")\n";
    }
    if (!config.verbose) print_stderr_block(f.stderr_text);
  }
  return result.exit_code == 0 ? 0 : 1;
}

void report_discovery(nf::InteractionService& svc, const CliConfig& config) {
  if (!config.verbose) return;
  const nf::DiscoveryReport& r = svc.cmd_plugins_report();
  std::cerr << "Plugins: " << r.loaded << " loaded (" << r.reused << " from cache), "
            << r.scanned << " files scanned"
            << (r.cache_written ? ", cache updated" : "") << "\n";
  for (const auto& s : r.skipped) std::cerr << "  skipped " << s.path << ": " << s.reason << "\n";
  for (const auto& e : r.errors) std::cerr << "  warning: " << e << "\n";
  for (const auto& p : svc.cmd_dropped_patterns()) std::cerr << "  invalid pattern " << p << "\n";
}
