// Shared fixtures for the ndflow test suites: scratch directories and
// shell-script plugins.
#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace nf_test {

namespace fs = std::filesystem;

// mkdtemp-backed directory removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string tmpl = (fs::temp_directory_path() / "ndflow_test_XXXXXX").string();
    if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
    path_ = tmpl;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  fs::path operator/(const std::string& rel) const { return path_ / rel; }

 private:
  fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& content) {
  if (p.has_parent_path()) fs::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// `#!/bin/sh` script carrying a metadata block. `tool_lines` go under
// [tool.ndflow], one TOML line each.
inline std::string plugin_source(const std::vector<std::string>& tool_lines,
                                 const std::string& body = "cat\n") {
  std::string out = "#!/bin/sh\n# /// script\n# requires-python = \">=3.11\"\n# dependencies = []\n";
  out += "# [tool.ndflow]\n";
  for (const auto& l : tool_lines) out += "# " + l + "\n";
  out += "# ///\n";
  return out + body;
}

inline fs::path write_plugin(const fs::path& p, const std::vector<std::string>& tool_lines,
                             const std::string& body = "cat\n") {
  write_file(p, plugin_source(tool_lines, body));
  fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read,
                  fs::perm_options::replace);
  return p;
}

// Move a file's mtime forward so cache checks see it as modified.
inline void touch_later(const fs::path& p, int seconds = 10) {
  fs::last_write_time(p, fs::last_write_time(p) + std::chrono::seconds(seconds));
}

}  // namespace nf_test
