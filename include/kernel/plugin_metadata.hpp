// ndflow kernel: plugin metadata and capability contract
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nf_types.hpp"

namespace nf {

// Declared (or directory-inferred) role of a plugin. Format plugins both read
// and write; protocol plugins fetch from a remote endpoint.
enum class PluginRole { Unspecified, Source, Filter, Target, Format, Protocol };

const char* role_name(PluginRole role);
std::optional<PluginRole> role_from_string(const std::string& name);

struct PluginCapabilities {
  bool supports_raw = false;
  bool manages_parameters = false;  // plugin parses its own address parameters
  bool supports_container = false;  // plugin can list a container (e.g. @api)
  std::optional<std::string> container_mode;

  bool operator==(const PluginCapabilities& o) const {
    return supports_raw == o.supports_raw && manages_parameters == o.manages_parameters &&
           supports_container == o.supports_container && container_mode == o.container_mode;
  }
};

struct PluginMetadata {
  std::string name;   // file stem, e.g. "csv_"
  std::string path;   // absolute once served by discovery, root-relative in the cache
  std::int64_t mtime = 0;  // file_time_type ticks
  std::vector<std::string> matches;
  std::optional<std::string> requires_runtime;
  std::vector<std::string> dependencies;
  PluginRole role = PluginRole::Unspecified;
  PluginCapabilities capabilities;
  std::vector<std::string> modes;  // empty: role default

  // Whether the plugin can be invoked with `--mode <mode>`.
  bool supports(Mode mode) const;

  bool operator==(const PluginMetadata& o) const {
    return name == o.name && path == o.path && mtime == o.mtime && matches == o.matches &&
           requires_runtime == o.requires_runtime && dependencies == o.dependencies &&
           role == o.role && capabilities == o.capabilities && modes == o.modes;
  }
};

// A file that was looked at but carries no usable metadata block.
struct NotAPlugin {
  std::string reason;
};

using ExtractResult = std::variant<PluginMetadata, NotAPlugin>;

using PluginMap = std::map<std::string, PluginMetadata>;

}  // namespace nf
