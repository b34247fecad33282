// ndflow kernel: plugin discovery (fresh, cached, and built-in fallback)
#include "kernel/plugin_discovery.hpp"

#include <algorithm>
#include <vector>

#include "kernel/metadata_extractor.hpp"

namespace nf {

namespace {

bool is_skipped_dir(const std::string& name) {
  return name.empty() || name[0] == '.' || name == "__pycache__";
}

bool is_skipped_file(const std::string& name) {
  return name.empty() || name[0] == '.' || name.rfind("__init__.", 0) == 0 ||
         name.rfind("test_", 0) == 0;
}

fs::path normalized_root(const fs::path& root) {
  std::error_code ec;
  fs::path abs = fs::absolute(root, ec);
  return (ec ? root : abs).lexically_normal();
}

// Candidate files under `root`, sorted for a deterministic duplicate policy.
// Throws fs::filesystem_error when the root cannot be walked.
std::vector<fs::path> list_candidates(const fs::path& root) {
  std::vector<fs::path> out;
  if (!fs::is_directory(root)) return out;

  auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied);
  for (auto end = fs::recursive_directory_iterator(); it != end; ++it) {
    const auto& entry = *it;
    const std::string name = entry.path().filename().string();
    std::error_code ec;
    if (entry.is_directory(ec)) {
      if (is_skipped_dir(name)) it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file(ec) || is_skipped_file(name)) continue;
    out.push_back(entry.path().lexically_normal());
  }
  std::sort(out.begin(), out.end());
  return out;
}

PluginRole role_from_directory(const fs::path& file, const fs::path& root) {
  fs::path rel = file.lexically_relative(root).parent_path();
  bool protocols = false, formats = false, filters = false;
  for (const auto& part : rel) {
    const std::string p = part.string();
    protocols = protocols || p == "protocols";
    formats = formats || p == "formats";
    filters = filters || p == "filters";
  }
  if (protocols) return PluginRole::Protocol;
  if (formats) return PluginRole::Format;
  if (filters) return PluginRole::Filter;
  return PluginRole::Unspecified;
}

// Extract one candidate; nullopt (and a skip record) when it is not a plugin.
std::optional<PluginMetadata> load_candidate(const fs::path& file, const fs::path& root,
                                             DiscoveryReport* report) {
  ExtractResult r = extract_metadata(file);
  if (const auto* skip = std::get_if<NotAPlugin>(&r)) {
    if (report) report->skipped.push_back({file.string(), skip->reason});
    return std::nullopt;
  }
  PluginMetadata meta = std::get<PluginMetadata>(std::move(r));
  if (meta.role == PluginRole::Unspecified) meta.role = role_from_directory(file, root);
  return meta;
}

std::int64_t file_mtime(const fs::path& file) {
  std::error_code ec;
  auto t = fs::last_write_time(file, ec);
  if (ec) return 0;
  return static_cast<std::int64_t>(t.time_since_epoch().count());
}

}  // namespace

PluginMap discover(const fs::path& root_in, DiscoveryReport* report) {
  PluginMap plugins;
  if (root_in.empty()) return plugins;
  const fs::path root = normalized_root(root_in);

  std::vector<fs::path> candidates;
  try {
    candidates = list_candidates(root);
  } catch (const fs::filesystem_error& e) {
    if (report) report->errors.push_back(std::string("plugin root: ") + e.what());
    return {};
  }

  for (const auto& file : candidates) {
    if (report) ++report->scanned;
    auto meta = load_candidate(file, root, report);
    if (!meta) continue;
    if (plugins.count(meta->name)) {
      if (report) report->skipped.push_back({file.string(), "duplicate plugin name"});
      continue;
    }
    plugins.emplace(meta->name, std::move(*meta));
    if (report) ++report->loaded;
  }
  return plugins;
}

PluginMap get_cached(const fs::path& root_in, const fs::path& cache_path, DiscoveryReport* report) {
  if (root_in.empty()) return {};
  const fs::path root = normalized_root(root_in);

  std::optional<PluginMap> cached = load_plugin_cache(cache_path, root);
  if (report) report->cache_loaded = cached.has_value();
  bool dirty = false;
  PluginMap previous = cached ? std::move(*cached) : PluginMap{};

  std::vector<fs::path> candidates;
  try {
    candidates = list_candidates(root);
  } catch (const fs::filesystem_error& e) {
    if (report) report->errors.push_back(std::string("plugin root: ") + e.what());
    return {};
  }

  PluginMap plugins;
  for (const auto& file : candidates) {
    if (report) ++report->scanned;
    const std::string name = file.stem().string();
    if (plugins.count(name)) {
      if (report) report->skipped.push_back({file.string(), "duplicate plugin name"});
      continue;
    }

    auto hit = previous.find(name);
    if (hit != previous.end() && hit->second.path == file.string() &&
        file_mtime(file) <= hit->second.mtime) {
      plugins.emplace(name, hit->second);
      if (report) {
        ++report->reused;
        ++report->loaded;
      }
      continue;
    }

    auto meta = load_candidate(file, root, report);
    if (!meta) continue;
    dirty = true;
    plugins.emplace(name, std::move(*meta));
    if (report) ++report->loaded;
  }

  // A missing cache is only created once there is something to record; a
  // corrupt one is always rebuilt.
  if (!cached) {
    std::error_code ec;
    if (!plugins.empty() || fs::exists(cache_path, ec)) dirty = true;
  }
  // Entries whose file disappeared.
  for (const auto& [name, meta] : previous) {
    if (!plugins.count(name)) dirty = true;
  }

  if (dirty) {
    try {
      save_plugin_cache(cache_path, root, plugins);
      if (report) report->cache_written = true;
    } catch (const FlowError& e) {
      if (report) report->errors.push_back(e.what());
    }
  }
  return plugins;
}

PluginMap get_with_fallback(const fs::path& user_root, const fs::path& cache_path,
                            const fs::path& builtin_root, DiscoveryReport* report) {
  PluginMap merged = discover(builtin_root, report);
  PluginMap user = get_cached(user_root, cache_path, report);
  for (auto& [name, meta] : user) merged[name] = std::move(meta);
  return merged;
}

}  // namespace nf
