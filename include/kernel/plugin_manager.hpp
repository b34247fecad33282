// ndflow kernel: PluginManager interface
#pragma once

#include <string>
#include <vector>

#include "kernel/pattern_registry.hpp"
#include "kernel/plugin_discovery.hpp"

namespace nf {

// Owns the discovered plugin map for one invocation and the pattern
// registry compiled from it.
// - Loads plugins through discovery (built-in root fresh, user root cached).
// - Rebuilds the registry whenever the map is replaced.
class PluginManager {
public:
    // Discover plugins from the given roots and replace the current map.
    DiscoveryReport load(const fs::path& user_root, const fs::path& cache_path,
                         const fs::path& builtin_root);
    // Replace the plugin map directly (used by tests and embedders).
    void set_plugins(PluginMap plugins);

    const PluginMap& plugins() const { return plugins_; }
    const PatternRegistry& registry() const { return registry_; }

    // nullptr when no plugin has that name.
    const PluginMetadata* find(const std::string& name) const;
    // First plugin (in name order) whose path contains `fragment`.
    const PluginMetadata* find_by_path_fragment(const std::string& fragment) const;
    // All plugin names in name order, for error messages and listings.
    std::vector<std::string> names() const;

private:
    PluginMap plugins_;
    PatternRegistry registry_;
};

} // namespace nf
