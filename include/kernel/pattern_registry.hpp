// ndflow kernel: activation pattern registry
#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "kernel/plugin_metadata.hpp"

namespace nf {

struct RegistryEntry {
  std::regex compiled;
  std::string pattern;      // source text, kept for listings
  std::string plugin_name;
  std::size_t specificity;  // length of the pattern text
  PluginRole role;
};

// Compiled view over a plugin map. Entries are ordered by specificity
// (longest pattern first); equal-length patterns keep discovery order, i.e.
// plugin name order then declaration order. Patterns that do not compile are
// dropped.
class PatternRegistry {
public:
    PatternRegistry() = default;
    explicit PatternRegistry(const PluginMap& plugins);

    // First plugin whose pattern is found anywhere in `source`.
    std::optional<std::string> match(const std::string& source) const;
    // Same, restricted to plugins of one role.
    std::optional<std::string> match_role(const std::string& source, PluginRole role) const;
    // [protocol, format] when a raw-capable protocol plugin and a format plugin
    // both match; otherwise the single best match, or nothing.
    std::vector<std::string> plan_for_read(const std::string& source) const;

    const std::vector<RegistryEntry>& entries() const { return entries_; }
    const std::vector<std::string>& dropped_patterns() const { return dropped_; }

private:
    std::vector<RegistryEntry> entries_;
    std::vector<std::string> raw_protocols_;  // protocol plugins with supports_raw
    std::vector<std::string> dropped_;        // "plugin: pattern"
};

}  // namespace nf
