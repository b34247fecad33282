#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nf_types.hpp"

namespace nf {

// Remote endpoint produced from a named profile.
struct ProfileEndpoint {
  std::string url;
  std::map<std::string, std::string> headers;
  std::vector<std::string> warnings;  // e.g. parameters the profile does not list
};

// A store of named profiles for one family of remote endpoints. `reference`
// is the address base (`@api/source` or `@api`). Failures throw
// FlowError(FlowErrc::Profile).
class ProfileStore {
 public:
  virtual ~ProfileStore() = default;
  virtual ProfileEndpoint resolve(const std::string& reference,
                                  const std::map<std::string, std::string>& params) const = 0;
  // Whether `name` names a container (an API directory) in this store.
  virtual bool has_container(const std::string& name) const = 0;
};

// HTTP API profiles: <dir>/<api>/_meta.json merged with <dir>/<api>/<source>.json.
class HttpProfileStore : public ProfileStore {
 public:
  explicit HttpProfileStore(std::vector<std::filesystem::path> search_dirs);

  ProfileEndpoint resolve(const std::string& reference,
                          const std::map<std::string, std::string>& params) const override;
  bool has_container(const std::string& name) const override;

  // Merged profile document for `api` (and `source` when non-empty).
  nlohmann::json load(const std::string& api, const std::string& source) const;

  const std::vector<std::filesystem::path>& search_dirs() const { return search_dirs_; }

 private:
  std::vector<std::filesystem::path> search_dirs_;
};

// Mail profiles: <dir>/<source>.json with a `defaults` object of query terms.
class GmailProfileStore : public ProfileStore {
 public:
  explicit GmailProfileStore(std::filesystem::path dir);

  ProfileEndpoint resolve(const std::string& reference,
                          const std::map<std::string, std::string>& params) const override;
  bool has_container(const std::string& name) const override;

 private:
  std::filesystem::path dir_;
};

// Replace every ${VAR} with its environment value; unset variables throw.
std::string substitute_env_vars(const std::string& value);

// application/x-www-form-urlencoded rendering of `params`.
std::string form_urlencode(const std::map<std::string, std::string>& params);

// Owns the profile stores and picks one by reference namespace.
class ProfileService {
 public:
  // `project_dir` is where `.ndflow/profiles` is looked up (normally the
  // working directory).
  ProfileService(const std::filesystem::path& home,
                 const std::vector<std::string>& extra_http_dirs,
                 const std::filesystem::path& gmail_dir,
                 const std::filesystem::path& project_dir);

  const ProfileStore& store_for(const std::string& ns) const;
  const HttpProfileStore& http() const { return *http_; }

  // Roots that hold per-plugin profile directories, highest priority first:
  // <project>/.ndflow/profiles and <home>/profiles.
  const std::vector<std::filesystem::path>& profile_roots() const { return profile_roots_; }

 private:
  std::unique_ptr<HttpProfileStore> http_;
  std::unique_ptr<GmailProfileStore> gmail_;
  std::vector<std::filesystem::path> profile_roots_;
};

}  // namespace nf
