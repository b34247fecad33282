// ndflow kernel: plugin discovery over plugin roots, with a persisted cache
#pragma once

#include <optional>

#include "kernel/plugin_metadata.hpp"
#include "kernel/plugin_result.hpp"

namespace nf {

inline constexpr int kPluginCacheVersion = 1;

// Walk `root` recursively and extract metadata from every candidate file.
// Skips `__init__.*`, `test_*`, hidden entries and `__pycache__`. Paths in the
// result are absolute. Never throws; an unreadable root yields an empty map.
PluginMap discover(const fs::path& root, DiscoveryReport* report = nullptr);

// Same as discover(), but reuses entries from `cache_path` whose recorded
// mtime is not older than the file's, and rewrites the cache when anything
// changed.
PluginMap get_cached(const fs::path& root, const fs::path& cache_path,
                     DiscoveryReport* report = nullptr);

// Built-in root (uncached) merged with the cached user root; user entries
// win on name collisions. Either root may be empty.
PluginMap get_with_fallback(const fs::path& user_root, const fs::path& cache_path,
                            const fs::path& builtin_root, DiscoveryReport* report = nullptr);

// Cache file I/O. Paths are stored relative to `root`. load_plugin_cache()
// returns nullopt for a missing, unreadable, corrupt or foreign-version file.
std::optional<PluginMap> load_plugin_cache(const fs::path& cache_path, const fs::path& root);
void save_plugin_cache(const fs::path& cache_path, const fs::path& root, const PluginMap& plugins);

}  // namespace nf
