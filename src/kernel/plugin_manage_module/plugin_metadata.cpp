// ndflow kernel: role names and the per-mode capability contract
#include "kernel/plugin_metadata.hpp"

#include <algorithm>

namespace nf {

const char* role_name(PluginRole role) {
  switch (role) {
    case PluginRole::Source: return "source";
    case PluginRole::Filter: return "filter";
    case PluginRole::Target: return "target";
    case PluginRole::Format: return "format";
    case PluginRole::Protocol: return "protocol";
    case PluginRole::Unspecified: break;
  }
  return "unspecified";
}

std::optional<PluginRole> role_from_string(const std::string& name) {
  if (name == "source") return PluginRole::Source;
  if (name == "filter") return PluginRole::Filter;
  if (name == "target") return PluginRole::Target;
  if (name == "format") return PluginRole::Format;
  if (name == "protocol") return PluginRole::Protocol;
  return std::nullopt;
}

bool PluginMetadata::supports(Mode mode) const {
  if (!modes.empty()) {
    return std::find(modes.begin(), modes.end(), mode_name(mode)) != modes.end();
  }
  switch (mode) {
    case Mode::Read:
      return role == PluginRole::Source || role == PluginRole::Format ||
             role == PluginRole::Protocol || role == PluginRole::Unspecified;
    case Mode::Write:
      return role == PluginRole::Target || role == PluginRole::Format ||
             role == PluginRole::Unspecified;
    case Mode::Raw:
      return capabilities.supports_raw || role == PluginRole::Protocol;
    case Mode::Filter:
      return role == PluginRole::Filter || role == PluginRole::Unspecified;
  }
  return false;
}

}  // namespace nf
