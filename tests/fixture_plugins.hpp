// In-memory plugin sets for resolver and planner tests.
#pragma once

#include <string>
#include <vector>

#include "kernel/address_resolver.hpp"
#include "kernel/plugin_manager.hpp"
#include "kernel/services/profile_service.hpp"
#include "test_support.hpp"

namespace nf_test {

inline nf::PluginMetadata make_plugin(const std::string& name, nf::PluginRole role,
                                      std::vector<std::string> matches = {},
                                      const std::string& dir = "formats") {
  nf::PluginMetadata m;
  m.name = name;
  m.path = "/opt/ndflow/plugins/" + dir + "/" + name + ".py";
  m.role = role;
  m.matches = std::move(matches);
  return m;
}

// csv/json/ndjson formats, an http protocol plugin that can fetch raw bytes,
// a gmail protocol plugin and a gz decompressor.
inline nf::PluginMap standard_plugins() {
  using R = nf::PluginRole;
  std::vector<nf::PluginMetadata> list = {
      make_plugin("csv_", R::Format, {".*\\.csv$", ".*\\.tsv$"}),
      make_plugin("json_", R::Format, {".*\\.json$"}),
      make_plugin("ndjson_", R::Format, {".*\\.ndjson$", ".*\\.jsonl$"}),
      make_plugin("http", R::Protocol, {"^https?://"}, "protocols"),
      make_plugin("gmail_", R::Protocol, {"^gmail://"}, "protocols"),
      make_plugin("gz_", R::Filter, {".*\\.gz$"}, "compression"),
  };
  list[3].capabilities.supports_raw = true;
  list[3].capabilities.supports_container = true;
  list[5].capabilities.supports_raw = true;
  nf::PluginMap out;
  for (auto& m : list) out.emplace(m.name, std::move(m));
  return out;
}

// PluginManager + ProfileService over a scratch home, wired to a resolver.
struct ResolverFixture {
  TempDir dir;
  nf::PluginManager plugins;
  nf::ProfileService profiles;
  nf::AddressResolver resolver;

  explicit ResolverFixture(nf::PluginMap map = standard_plugins())
      : profiles(dir.path() / "home", {}, dir.path() / "home" / "profiles" / "gmail",
                 dir.path() / "project"),
        resolver(plugins, profiles) {
    plugins.set_plugins(std::move(map));
  }

  std::filesystem::path home() const { return dir.path() / "home"; }
};

}  // namespace nf_test
