// ndflow kernel: persisted plugin cache (JSON, root-relative paths)
#include <fstream>

#include <nlohmann/json.hpp>

#include "kernel/plugin_discovery.hpp"

namespace nf {

namespace {

using nlohmann::json;

json to_json_record(const PluginMetadata& p, const fs::path& root) {
  json j;
  fs::path rel = fs::path(p.path).lexically_relative(root);
  j["path"] = rel.empty() ? p.path : rel.generic_string();
  j["mtime"] = p.mtime;
  j["matches"] = p.matches;
  j["dependencies"] = p.dependencies;
  j["role"] = p.role == PluginRole::Unspecified ? json(nullptr) : json(role_name(p.role));
  j["requires_runtime"] = p.requires_runtime ? json(*p.requires_runtime) : json(nullptr);
  j["modes"] = p.modes;
  j["supports_raw"] = p.capabilities.supports_raw;
  j["manages_parameters"] = p.capabilities.manages_parameters;
  j["supports_container"] = p.capabilities.supports_container;
  j["container_mode"] = p.capabilities.container_mode ? json(*p.capabilities.container_mode)
                                                      : json(nullptr);
  return j;
}

// Throws json::exception on records of the wrong shape.
PluginMetadata from_json_record(const std::string& name, const json& j, const fs::path& root) {
  PluginMetadata p;
  p.name = name;
  p.path = (root / j.at("path").get<std::string>()).lexically_normal().string();
  p.mtime = j.at("mtime").get<std::int64_t>();
  p.matches = j.at("matches").get<std::vector<std::string>>();
  p.dependencies = j.value("dependencies", std::vector<std::string>{});
  if (j.contains("role") && j["role"].is_string()) {
    if (auto role = role_from_string(j["role"].get<std::string>())) p.role = *role;
  }
  if (j.contains("requires_runtime") && j["requires_runtime"].is_string()) {
    p.requires_runtime = j["requires_runtime"].get<std::string>();
  }
  p.modes = j.value("modes", std::vector<std::string>{});
  p.capabilities.supports_raw = j.value("supports_raw", false);
  p.capabilities.manages_parameters = j.value("manages_parameters", false);
  p.capabilities.supports_container = j.value("supports_container", false);
  if (j.contains("container_mode") && j["container_mode"].is_string()) {
    p.capabilities.container_mode = j["container_mode"].get<std::string>();
  }
  return p;
}

}  // namespace

std::optional<PluginMap> load_plugin_cache(const fs::path& cache_path, const fs::path& root) {
  std::ifstream in(cache_path);
  if (!in) return std::nullopt;
  json doc = json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
  if (!doc.contains("version") || !doc["version"].is_number_integer() ||
      doc["version"].get<int>() != kPluginCacheVersion) {
    return std::nullopt;
  }
  if (!doc.contains("plugins") || !doc["plugins"].is_object()) return std::nullopt;

  PluginMap out;
  try {
    for (const auto& [name, record] : doc["plugins"].items()) {
      out.emplace(name, from_json_record(name, record, root));
    }
  } catch (const json::exception&) {
    return std::nullopt;
  }
  return out;
}

void save_plugin_cache(const fs::path& cache_path, const fs::path& root, const PluginMap& plugins) {
  json doc;
  doc["version"] = kPluginCacheVersion;
  doc["plugins"] = json::object();
  for (const auto& [name, meta] : plugins) doc["plugins"][name] = to_json_record(meta, root);

  std::error_code ec;
  if (cache_path.has_parent_path()) fs::create_directories(cache_path.parent_path(), ec);
  fs::path tmp = cache_path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw FlowError(FlowErrc::Io, "Cannot write plugin cache '" + tmp.string() + "'");
    out << doc.dump(2) << '\n';
    if (!out) throw FlowError(FlowErrc::Io, "Cannot write plugin cache '" + tmp.string() + "'");
  }
  fs::rename(tmp, cache_path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw FlowError(FlowErrc::Io, "Cannot replace plugin cache '" + cache_path.string() + "'");
  }
}

}  // namespace nf
