// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <pwd.h>
#include <sstream>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace {

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string user_home() {
    std::string home = env_or_empty("HOME");
    if (home.empty()) {
        struct passwd* pw = getpwuid(getuid());
        if (pw && pw->pw_dir) home = pw->pw_dir;
    }
    return home;
}

std::string or_under_home(const std::string& value, const std::string& home, const fs::path& rel) {
    if (!value.empty()) return value;
    return (fs::path(home) / rel).string();
}

YAML::Node to_node(const CliConfig& c) {
    YAML::Node root;
    root["plugin_dir"] = or_under_home(c.plugin_dir, c.home, "plugins");
    root["builtin_plugin_dir"] = or_under_home(c.builtin_plugin_dir, c.home, "builtin");
    root["cache_path"] = or_under_home(c.cache_path, c.home, "cache.json");
    root["profile_dirs"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& d : c.profile_dirs) root["profile_dirs"].push_back(d);
    root["gmail_profile_dir"] = or_under_home(c.gmail_profile_dir, c.home, fs::path("profiles") / "gmail");
    root["plugin_runner"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& a : c.plugin_runner) root["plugin_runner"].push_back(a);
    root["default_head_lines"] = c.default_head_lines;
    root["verbose"] = c.verbose;
    return root;
}

// Relative paths in a config file are taken relative to the file itself.
std::string anchor(const std::string& value, const fs::path& base) {
    if (value.empty()) return value;
    fs::path p(value);
    if (p.is_absolute() || base.empty()) return value;
    return (base / p).lexically_normal().string();
}

} // namespace

std::string resolve_home_dir(const std::string& override_dir) {
    if (!override_dir.empty()) return override_dir;
    std::string v = env_or_empty("NDFLOW_HOME");
    if (!v.empty()) return v;
    v = env_or_empty("XDG_CONFIG_HOME");
    if (!v.empty()) return (fs::path(v) / "ndflow").string();
    return (fs::path(user_home()) / ".config" / "ndflow").string();
}

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root = to_node(config);
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    std::ofstream fout(path);
    if (!fout) return false;
    fout << "# ndflow configuration\n" << root << "\n";
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (!fs::exists(config_path)) return;
    const fs::path base = fs::absolute(config_path).parent_path();
    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (root.IsNull()) {
            config.loaded_config_path = fs::absolute(config_path).string();
            return;
        }
        if (!root.IsMap()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "top level must be a mapping");
        }
        CliConfig loaded = config;
        if (root["plugin_dir"]) loaded.plugin_dir = anchor(root["plugin_dir"].as<std::string>(), base);
        if (root["builtin_plugin_dir"])
            loaded.builtin_plugin_dir = anchor(root["builtin_plugin_dir"].as<std::string>(), base);
        if (root["cache_path"]) loaded.cache_path = anchor(root["cache_path"].as<std::string>(), base);
        if (root["profile_dirs"] && root["profile_dirs"].IsSequence()) {
            loaded.profile_dirs.clear();
            for (const auto& d : root["profile_dirs"].as<std::vector<std::string>>()) {
                loaded.profile_dirs.push_back(anchor(d, base));
            }
        } else if (root["profile_dir"] && root["profile_dir"].IsScalar()) {
            loaded.profile_dirs = {anchor(root["profile_dir"].as<std::string>(), base)};
        }
        if (root["gmail_profile_dir"])
            loaded.gmail_profile_dir = anchor(root["gmail_profile_dir"].as<std::string>(), base);
        if (root["plugin_runner"]) {
            if (root["plugin_runner"].IsSequence()) {
                loaded.plugin_runner = root["plugin_runner"].as<std::vector<std::string>>();
            } else {
                std::istringstream iss(root["plugin_runner"].as<std::string>());
                loaded.plugin_runner.clear();
                for (std::string word; iss >> word;) loaded.plugin_runner.push_back(word);
            }
        }
        if (root["default_head_lines"]) loaded.default_head_lines = root["default_head_lines"].as<int>();
        if (root["verbose"]) loaded.verbose = root["verbose"].as<bool>();
        if (loaded.default_head_lines < 0) {
            throw YAML::Exception(YAML::Mark::null_mark(), "default_head_lines must not be negative");
        }
        loaded.loaded_config_path = fs::absolute(config_path).string();
        config = loaded;
    } catch (const YAML::Exception& e) {
        std::cerr << "Warning: Could not parse config file '" << config_path
                  << "'. Using default settings. Error: " << e.what() << std::endl;
    }
}

std::string config_to_yaml(const CliConfig& config) {
    YAML::Emitter out;
    out << to_node(config);
    return std::string(out.c_str()) + "\n";
}

nf::KernelOptions to_kernel_options(const CliConfig& config) {
    nf::KernelOptions opts;
    opts.home = config.home;
    opts.plugin_dir = config.plugin_dir;
    opts.builtin_plugin_dir = config.builtin_plugin_dir;
    opts.cache_path = config.cache_path;
    opts.profile_dirs = config.profile_dirs;
    opts.gmail_profile_dir = config.gmail_profile_dir;
    opts.plugin_runner = config.plugin_runner;
    return opts;
}
