// ndflow kernel: metadata block extraction
#include "kernel/metadata_extractor.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

#include "kernel/param_utils.hpp"

namespace nf {

namespace {

// Blocks are expected near the top of a file.
constexpr std::size_t kHeadBytes = 64 * 1024;

bool is_block_type(const std::string& s) {
  if (s.empty()) return false;
  for (unsigned char c : s) {
    if (!std::isalnum(c) && c != '-') return false;
  }
  return true;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

bool is_comment_line(const std::string& line) {
  return line == "#" || line.rfind("# ", 0) == 0;
}

}  // namespace

std::optional<std::string> find_script_block(const std::string& text) {
  static const std::string kOpen = "# /// ";
  static const std::string kClose = "# ///";

  auto lines = split_lines(text);
  std::size_t i = 0;
  while (i < lines.size()) {
    const std::string& line = lines[i];
    if (line.rfind(kOpen, 0) != 0 || !is_block_type(line.substr(kOpen.size()))) {
      ++i;
      continue;
    }
    const std::string type = line.substr(kOpen.size());

    // The block runs over the contiguous comment lines that follow and is
    // closed by the last `# ///` among them.
    std::size_t end = i + 1;
    std::size_t close = 0;
    bool closed = false;
    while (end < lines.size() && is_comment_line(lines[end])) {
      if (lines[end] == kClose && end > i + 1) {
        close = end;
        closed = true;
      }
      ++end;
    }
    if (!closed) {
      ++i;
      continue;
    }
    if (type != "script") {
      i = close + 1;
      continue;
    }

    std::string body;
    for (std::size_t k = i + 1; k < close; ++k) {
      const std::string& l = lines[k];
      body += (l.size() >= 2 ? l.substr(2) : std::string());
      body += '\n';
    }
    return body;
  }
  return std::nullopt;
}

ExtractResult extract_metadata(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) return NotAPlugin{"unreadable"};
  std::string head(kHeadBytes, '\0');
  in.read(&head[0], static_cast<std::streamsize>(head.size()));
  if (in.bad()) return NotAPlugin{"unreadable"};
  head.resize(static_cast<std::size_t>(in.gcount()));

  auto block = find_script_block(head);
  if (!block) return NotAPlugin{"no metadata block"};

  YAML::Node doc;
  try {
    doc = parse_toml_document(*block);
  } catch (const FlowError& e) {
    return NotAPlugin{std::string("metadata block does not parse: ") + e.what()};
  }

  PluginMetadata meta;
  meta.name = file.stem().string();
  std::error_code ec;
  fs::path abs = fs::absolute(file, ec);
  meta.path = ec ? file.string() : abs.lexically_normal().string();
  auto mtime = fs::last_write_time(file, ec);
  if (ec) return NotAPlugin{"unreadable"};
  meta.mtime = static_cast<std::int64_t>(mtime.time_since_epoch().count());

  if (doc["requires-python"]) {
    meta.requires_runtime = as_str(doc, "requires-python");
  } else if (doc["requires-runtime"]) {
    meta.requires_runtime = as_str(doc, "requires-runtime");
  }
  meta.dependencies = as_str_list(doc, "dependencies");

  YAML::Node tool;
  if (doc["tool"] && doc["tool"].IsMap() && doc["tool"][kToolTable]) {
    tool.reset(doc["tool"][kToolTable]);
  }
  if (tool && tool.IsMap()) {
    meta.matches = as_str_list(tool, "matches");
    if (auto role = role_from_string(as_str(tool, "role"))) meta.role = *role;
    meta.capabilities.supports_raw = as_bool_flexible(tool, "supports_raw", false);
    meta.capabilities.manages_parameters = as_bool_flexible(tool, "manages_parameters", false);
    meta.capabilities.supports_container = as_bool_flexible(tool, "supports_container", false);
    std::string container_mode = as_str(tool, "container_mode");
    if (!container_mode.empty()) meta.capabilities.container_mode = container_mode;
    meta.modes = as_str_list(tool, "modes");
  }
  return meta;
}

}  // namespace nf
