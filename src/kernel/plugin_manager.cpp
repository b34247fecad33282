// ndflow kernel: PluginManager implementation
#include "kernel/plugin_manager.hpp"

#include <utility>

namespace nf {

DiscoveryReport PluginManager::load(const fs::path& user_root, const fs::path& cache_path,
                                    const fs::path& builtin_root) {
  DiscoveryReport report;
  set_plugins(get_with_fallback(user_root, cache_path, builtin_root, &report));
  return report;
}

void PluginManager::set_plugins(PluginMap plugins) {
  plugins_ = std::move(plugins);
  registry_ = PatternRegistry(plugins_);
}

const PluginMetadata* PluginManager::find(const std::string& name) const {
  auto it = plugins_.find(name);
  return it == plugins_.end() ? nullptr : &it->second;
}

const PluginMetadata* PluginManager::find_by_path_fragment(const std::string& fragment) const {
  for (const auto& [name, meta] : plugins_) {
    std::string generic = fs::path(meta.path).generic_string();
    if (generic.find(fragment) != std::string::npos) return &meta;
  }
  return nullptr;
}

std::vector<std::string> PluginManager::names() const {
  std::vector<std::string> out;
  out.reserve(plugins_.size());
  for (const auto& [name, meta] : plugins_) out.push_back(name);
  return out;
}

}  // namespace nf
