#include "kernel/services/profile_service.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <set>
#include <utility>

namespace nf {

namespace {

using nlohmann::json;

json read_json_file(const fs::path& file) {
  std::ifstream in(file);
  if (!in) throw FlowError(FlowErrc::Profile, "Cannot read " + file.string());
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw FlowError(FlowErrc::Profile, "Invalid JSON in " + file.string() + ": " + e.what());
  }
}

bool exists_quiet(const fs::path& p) {
  std::error_code ec;
  return fs::exists(p, ec);
}

std::string json_scalar_to_string(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

// "@api/source" -> {"api", "source"}; "@api" -> {"api", ""}.
std::pair<std::string, std::string> split_reference(const std::string& reference) {
  if (reference.empty() || reference[0] != '@') {
    throw FlowError(FlowErrc::Profile,
                    "Invalid profile reference (must start with @): " + reference);
  }
  std::string ref = reference.substr(1);
  auto slash = ref.find('/');
  if (slash == std::string::npos) return {ref, ""};
  return {ref.substr(0, slash), ref.substr(slash + 1)};
}

std::string form_encode_component(const std::string& text) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else if (c == ' ') {
      out.push_back('+');
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

}  // namespace

std::string substitute_env_vars(const std::string& value) {
  static const std::regex kVar(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
  std::string out;
  auto begin = std::sregex_iterator(value.begin(), value.end(), kVar);
  std::size_t last = 0;
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const auto& m = *it;
    const std::string name = m[1].str();
    const char* v = std::getenv(name.c_str());
    if (!v) throw FlowError(FlowErrc::Profile, "Environment variable " + name + " not set");
    out.append(value, last, static_cast<std::size_t>(m.position(0)) - last);
    out += v;
    last = static_cast<std::size_t>(m.position(0) + m.length(0));
  }
  out.append(value, last, std::string::npos);
  return out;
}

std::string form_urlencode(const std::map<std::string, std::string>& params) {
  std::string out;
  for (const auto& [k, v] : params) {
    if (!out.empty()) out += '&';
    out += form_encode_component(k) + "=" + form_encode_component(v);
  }
  return out;
}

// ---------------------------------------------------------------- HTTP

HttpProfileStore::HttpProfileStore(std::vector<fs::path> search_dirs)
    : search_dirs_(std::move(search_dirs)) {}

bool HttpProfileStore::has_container(const std::string& name) const {
  if (name.empty()) return false;
  for (const auto& dir : search_dirs_) {
    if (exists_quiet(dir / name)) return true;
  }
  return false;
}

json HttpProfileStore::load(const std::string& api, const std::string& source) const {
  json meta = json::object();
  json src = json::object();
  bool found = false;
  for (const auto& dir : search_dirs_) {
    fs::path api_dir = dir / api;
    if (!exists_quiet(api_dir)) continue;

    fs::path meta_file = api_dir / "_meta.json";
    if (exists_quiet(meta_file)) meta = read_json_file(meta_file);

    if (!source.empty()) {
      fs::path source_file = api_dir / (source + ".json");
      if (exists_quiet(source_file)) {
        src = read_json_file(source_file);
      } else if (!meta.empty()) {
        throw FlowError(FlowErrc::Profile, "Source not found: " + api + "/" + source);
      }
    }
    if (!meta.empty()) {
      found = true;
      break;
    }
  }
  if (!found) throw FlowError(FlowErrc::Profile, "Profile not found: " + api);
  if (!meta.is_object() || !src.is_object()) {
    throw FlowError(FlowErrc::Profile, "Profile documents for " + api + " must be JSON objects");
  }
  for (auto it = src.begin(); it != src.end(); ++it) meta[it.key()] = it.value();
  return meta;
}

ProfileEndpoint HttpProfileStore::resolve(const std::string& reference,
                                          const std::map<std::string, std::string>& params) const {
  auto [api, source] = split_reference(reference);
  json profile = load(api, source);
  ProfileEndpoint ep;

  if (!params.empty() && profile.contains("params") && profile["params"].is_array()) {
    std::set<std::string> allowed;
    for (const auto& p : profile["params"]) {
      if (p.is_string()) allowed.insert(p.get<std::string>());
    }
    std::string unknown;
    for (const auto& [k, v] : params) {
      if (allowed.count(k)) continue;
      if (!unknown.empty()) unknown += ", ";
      unknown += k;
    }
    if (!unknown.empty()) {
      std::string supported;
      for (const auto& a : allowed) supported += (supported.empty() ? "" : ", ") + a;
      ep.warnings.push_back("Parameters " + unknown + " are not supported by " + reference +
                            " (supported: " + supported + "); the API may ignore them.");
    }
  }

  std::string base_url =
      substitute_env_vars(profile.contains("base_url") ? json_scalar_to_string(profile["base_url"])
                                                       : std::string());
  std::string path = profile.contains("path") ? json_scalar_to_string(profile["path"]) : "";
  while (!base_url.empty() && base_url.back() == '/') base_url.pop_back();
  std::size_t lead = path.find_first_not_of('/');
  path = lead == std::string::npos ? std::string() : path.substr(lead);

  ep.url = path.empty() ? base_url : base_url + "/" + path;
  if (!params.empty()) ep.url += "?" + form_urlencode(params);

  if (profile.contains("headers") && profile["headers"].is_object()) {
    for (auto it = profile["headers"].begin(); it != profile["headers"].end(); ++it) {
      ep.headers[it.key()] = substitute_env_vars(json_scalar_to_string(it.value()));
    }
  }
  return ep;
}

// ---------------------------------------------------------------- Gmail

GmailProfileStore::GmailProfileStore(fs::path dir) : dir_(std::move(dir)) {}

bool GmailProfileStore::has_container(const std::string& name) const {
  return name == "gmail" && exists_quiet(dir_);
}

ProfileEndpoint GmailProfileStore::resolve(const std::string& reference,
                                           const std::map<std::string, std::string>& params) const {
  static const std::string kPrefix = "@gmail/";
  if (reference.rfind(kPrefix, 0) != 0 || reference.size() == kPrefix.size()) {
    throw FlowError(FlowErrc::Profile,
                    "Invalid Gmail reference (must start with @gmail/): " + reference);
  }
  const std::string source = reference.substr(kPrefix.size());
  fs::path file = dir_ / (source + ".json");
  if (!exists_quiet(file)) {
    throw FlowError(FlowErrc::Profile,
                    "Gmail profile '" + source + "' not found at " + file.string());
  }
  json profile = read_json_file(file);

  std::map<std::string, std::string> merged;
  if (profile.is_object() && profile.contains("defaults") && profile["defaults"].is_object()) {
    for (auto it = profile["defaults"].begin(); it != profile["defaults"].end(); ++it) {
      merged[it.key()] = json_scalar_to_string(it.value());
    }
  }
  for (const auto& [k, v] : params) merged[k] = v;

  ProfileEndpoint ep;
  ep.url = "gmail://me/messages";
  if (!merged.empty()) ep.url += "?" + form_urlencode(merged);
  return ep;
}

// ---------------------------------------------------------------- service

ProfileService::ProfileService(const fs::path& home, const std::vector<std::string>& extra_http_dirs,
                               const fs::path& gmail_dir, const fs::path& project_dir) {
  profile_roots_ = {project_dir / ".ndflow" / "profiles", home / "profiles"};

  std::vector<fs::path> http_dirs;
  for (const auto& root : profile_roots_) http_dirs.push_back(root / "http");
  for (const auto& extra : extra_http_dirs) {
    if (!extra.empty()) http_dirs.emplace_back(extra);
  }
  http_ = std::make_unique<HttpProfileStore>(std::move(http_dirs));
  gmail_ = std::make_unique<GmailProfileStore>(gmail_dir.empty() ? home / "profiles" / "gmail"
                                                                 : gmail_dir);
}

const ProfileStore& ProfileService::store_for(const std::string& ns) const {
  if (ns == "gmail") return *gmail_;
  return *http_;
}

}  // namespace nf
