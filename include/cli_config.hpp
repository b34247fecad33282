// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <string>
#include <vector>

#include "kernel/kernel.hpp"

// Kept in the global namespace like the rest of the CLI front end.
struct CliConfig {
    std::string loaded_config_path;
    std::string home;
    // Empty paths mean "derive from home" (see to_kernel_options).
    std::string plugin_dir;
    std::string builtin_plugin_dir;
    std::string cache_path;
    std::vector<std::string> profile_dirs;
    std::string gmail_profile_dir;
    std::vector<std::string> plugin_runner;
    int default_head_lines = 10;
    bool verbose = false;
};

// Home directory: explicit override, then $NDFLOW_HOME, then
// $XDG_CONFIG_HOME/ndflow, then ~/.config/ndflow.
std::string resolve_home_dir(const std::string& override_dir = "");

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load `config_path` into `config` if it exists. A missing file leaves the
// defaults in place; an unparsable one is reported on stderr and ignored.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// Effective configuration as YAML text (relative paths already resolved).
std::string config_to_yaml(const CliConfig& config);

nf::KernelOptions to_kernel_options(const CliConfig& config);
