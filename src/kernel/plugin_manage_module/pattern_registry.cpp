// ndflow kernel: activation pattern registry
#include "kernel/pattern_registry.hpp"

#include <algorithm>

namespace nf {

PatternRegistry::PatternRegistry(const PluginMap& plugins) {
  for (const auto& [name, meta] : plugins) {
    if (meta.role == PluginRole::Protocol && meta.capabilities.supports_raw) {
      raw_protocols_.push_back(name);
    }
    for (const auto& pattern : meta.matches) {
      try {
        entries_.push_back({std::regex(pattern, std::regex::ECMAScript), pattern, name,
                            pattern.size(), meta.role});
      } catch (const std::regex_error&) {
        dropped_.push_back(name + ": " + pattern);
      }
    }
  }
  std::stable_sort(entries_.begin(), entries_.end(),
                   [](const RegistryEntry& a, const RegistryEntry& b) {
                     return a.specificity > b.specificity;
                   });
}

std::optional<std::string> PatternRegistry::match(const std::string& source) const {
  for (const auto& e : entries_) {
    if (std::regex_search(source, e.compiled)) return e.plugin_name;
  }
  return std::nullopt;
}

std::optional<std::string> PatternRegistry::match_role(const std::string& source,
                                                       PluginRole role) const {
  for (const auto& e : entries_) {
    if (e.role == role && std::regex_search(source, e.compiled)) return e.plugin_name;
  }
  return std::nullopt;
}

std::vector<std::string> PatternRegistry::plan_for_read(const std::string& source) const {
  auto proto = match_role(source, PluginRole::Protocol);
  auto fmt = match_role(source, PluginRole::Format);
  if (proto && fmt &&
      std::find(raw_protocols_.begin(), raw_protocols_.end(), *proto) != raw_protocols_.end()) {
    return {*proto, *fmt};
  }
  if (auto single = match(source)) return {*single};
  return {};
}

}  // namespace nf
