// ndflow kernel: address -> plugin resolution
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kernel/address.hpp"
#include "kernel/plugin_manager.hpp"
#include "kernel/services/profile_service.hpp"

namespace nf {

// Outcome of resolving one address for one mode. Never persisted.
struct ResolvedAddress {
  Address address;
  std::string plugin_name;
  std::string plugin_path;
  ConfigMap config;
  std::optional<std::string> url;
  std::optional<std::map<std::string, std::string>> headers;
  std::vector<std::string> warnings;  // non-fatal profile notes
};

// Query value -> typed config value: true/false (any case) become bools,
// numeric literals become int64 or double, everything else stays a string.
ConfigValue coerce_value(const std::string& text);
ConfigMap coerce_parameters(const std::map<std::string, std::string>& params);

class AddressResolver {
public:
    AddressResolver(const PluginManager& plugins, const ProfileService& profiles);

    // Pick the plugin for `address` in `mode` and build its invocation.
    // Throws FlowError(FlowErrc::Resolution); the message lists known plugins.
    ResolvedAddress resolve(const Address& address, Mode mode) const;

    // Lookups shared with the planner; all throw FlowError(Resolution).
    const PluginMetadata& find_by_format(const std::string& format) const;
    const PluginMetadata& find_by_name(const std::string& name) const;
    // Exact name, then name + "_"; nullptr when neither exists.
    const PluginMetadata* lookup(const std::string& name) const;

    // Remote URL (and headers) for `address` served by `plugin`.
    void resolve_endpoint(const Address& address, const PluginMetadata& plugin,
                          ResolvedAddress& out) const;

    const PluginManager& plugins() const { return plugins_; }

    [[noreturn]] void fail(const std::string& message) const;

private:
    const PluginMetadata& find_plugin(const Address& address) const;
    const PluginMetadata& find_by_protocol(const Address& address) const;
    const PluginMetadata& find_for_profile(const Address& address) const;
    const PluginMetadata& find_by_pattern(const std::string& source) const;

    const PluginManager& plugins_;
    const ProfileService& profiles_;
};

}  // namespace nf
