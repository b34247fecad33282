// ndflow kernel: address -> plugin resolution
#include "kernel/address_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace nf {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += sep;
    out += s;
  }
  return out;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string strip_underscore(const std::string& name) {
  std::string out = name;
  while (!out.empty() && out.back() == '_') out.pop_back();
  return out;
}

// Hints for a file nothing matched.
std::string file_suggestions(const std::string& source) {
  std::string ext = lower(fs::path(source).extension().string());
  if (ext == ".txt" || ext == ".dat" || ext == ".data") {
    return "; try CSV format: " + source + "~csv";
  }
  if (ext.empty()) {
    return "; add a file extension or use a format override: " + source + "~csv";
  }
  return "; use a format override: " + source + "~<format>";
}

}  // namespace

ConfigValue coerce_value(const std::string& text) {
  static const std::regex kNumber(R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?$)");
  const std::string low = lower(text);
  if (low == "true") return true;
  if (low == "false") return false;
  if (std::regex_match(text, kNumber)) {
    try {
      if (text.find_first_of(".eE") != std::string::npos) return std::stod(text);
      return static_cast<std::int64_t>(std::stoll(text));
    } catch (const std::out_of_range&) {
      return text;
    }
  }
  return text;
}

ConfigMap coerce_parameters(const std::map<std::string, std::string>& params) {
  ConfigMap out;
  for (const auto& [k, v] : params) out.emplace(k, coerce_value(v));
  return out;
}

AddressResolver::AddressResolver(const PluginManager& plugins, const ProfileService& profiles)
    : plugins_(plugins), profiles_(profiles) {}

void AddressResolver::fail(const std::string& message) const {
  auto names = plugins_.names();
  throw FlowError(FlowErrc::Resolution,
                  message + " (known plugins: " + (names.empty() ? "none" : join(names, ", ")) + ")");
}

const PluginMetadata* AddressResolver::lookup(const std::string& name) const {
  if (const auto* p = plugins_.find(name)) return p;
  return plugins_.find(name + "_");
}

const PluginMetadata& AddressResolver::find_by_name(const std::string& name) const {
  if (const auto* p = lookup(name)) return *p;
  fail("Plugin not found: " + name);
}

const PluginMetadata& AddressResolver::find_by_format(const std::string& format) const {
  if (const auto* p = lookup(format)) return *p;
  if (const auto* p = plugins_.find_by_path_fragment("/formats/" + format)) return *p;
  fail("Plugin not found for format: " + format + " (usage: source~" + format + ")");
}

const PluginMetadata& AddressResolver::find_by_pattern(const std::string& source) const {
  if (auto name = plugins_.registry().match(source)) {
    if (const auto* p = plugins_.find(*name)) return *p;
  }
  fail("No plugin found for: " + source + file_suggestions(source));
}

const PluginMetadata& AddressResolver::find_by_protocol(const Address& address) const {
  const std::string scheme = address.scheme();
  if (const auto* p = lookup(scheme)) return *p;
  if (auto name = plugins_.registry().match(address.base)) {
    if (const auto* p = plugins_.find(*name)) return *p;
  }
  fail("Plugin not found for protocol: " + scheme + " (example: " + scheme + "://...)");
}

const PluginMetadata& AddressResolver::find_for_profile(const Address& address) const {
  const std::string ns = address.reference_namespace();
  if (const auto* p = lookup(ns)) return *p;

  // A protocol plugin owning a profile directory for this namespace.
  for (const auto& [name, meta] : plugins_.plugins()) {
    if (meta.role != PluginRole::Protocol) continue;
    const std::string profile_type = strip_underscore(name);
    for (const auto& root : profiles_.profile_roots()) {
      std::error_code ec;
      if (fs::exists(root / profile_type / ns, ec)) return meta;
    }
  }
  return find_by_name("http");
}

const PluginMetadata& AddressResolver::find_plugin(const Address& address) const {
  if (address.format_override) return find_by_format(*address.format_override);

  switch (address.kind) {
    case AddressKind::Protocol:
      return find_by_protocol(address);
    case AddressKind::Profile:
      return find_for_profile(address);
    case AddressKind::Plugin: {
      const std::string name = address.base.substr(1);
      if (profiles_.http().has_container(name)) return find_by_name("http");
      return find_by_name(name);
    }
    case AddressKind::Stdio:
      return find_by_format("ndjson");
    case AddressKind::File:
      return find_by_pattern(address.base);
  }
  fail("Cannot determine plugin for address: " + address.raw);
}

void AddressResolver::resolve_endpoint(const Address& address, const PluginMetadata& plugin,
                                       ResolvedAddress& out) const {
  const bool self_managed = plugin.role == PluginRole::Protocol ||
                            plugin.capabilities.manages_parameters;

  if (address.kind == AddressKind::Protocol) {
    out.url = address.full_base();
    return;
  }

  const std::string type = strip_underscore(plugin.name);
  // `@api` naming an HTTP profile directory is served like `@api/...`.
  const bool http_container = address.kind == AddressKind::Plugin && type == "http" &&
                              profiles_.http().has_container(address.reference_namespace());

  if (address.kind == AddressKind::Profile || http_container) {
    const std::string ns = address.reference_namespace();
    if (plugin.role == PluginRole::Protocol && type != "http" && type != "gmail") {
      out.url = to_string(address);
      return;
    }
    try {
      ProfileEndpoint ep = profiles_.store_for(ns).resolve(address.base, address.parameters);
      out.url = ep.url;
      if (ns != "gmail") out.headers = ep.headers;
      out.warnings = ep.warnings;
    } catch (const FlowError& e) {
      if (e.code() != FlowErrc::Profile) throw;
      fail(std::string("Profile resolution failed: ") + e.what());
    }
    return;
  }

  if (self_managed) out.url = to_string(address);
}

ResolvedAddress AddressResolver::resolve(const Address& address, Mode mode) const {
  const PluginMetadata& plugin = find_plugin(address);
  if (!plugin.supports(mode)) {
    fail("Plugin '" + plugin.name + "' (role " + role_name(plugin.role) + ") does not support " +
         mode_name(mode) + " mode");
  }

  ResolvedAddress out;
  out.address = address;
  out.plugin_name = plugin.name;
  out.plugin_path = plugin.path;

  const bool self_managed = plugin.role == PluginRole::Protocol ||
                            plugin.capabilities.manages_parameters;
  if (!self_managed) out.config = coerce_parameters(address.parameters);

  resolve_endpoint(address, plugin, out);
  return out;
}

}  // namespace nf
