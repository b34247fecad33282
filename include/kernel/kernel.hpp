// ndflow kernel: Kernel facade (discovery, resolution, planning, execution)
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kernel/address_resolver.hpp"
#include "kernel/pipeline_executor.hpp"
#include "kernel/plugin_manager.hpp"
#include "kernel/services/pipeline_planner.hpp"
#include "kernel/services/profile_service.hpp"

namespace nf {

struct KernelOptions {
    fs::path home;
    fs::path plugin_dir;          // cached user root
    fs::path builtin_plugin_dir;  // uncached built-in root
    fs::path cache_path;
    std::vector<std::string> profile_dirs;  // extra HTTP profile dirs
    fs::path gmail_profile_dir;
    std::vector<std::string> plugin_runner;  // argv prefix, e.g. {"uv", "run", "--script"}
    fs::path project_dir;  // where `.ndflow/profiles` is looked up; empty: working directory
};

// Plan for one address, as shown by `explain`.
struct AddressPlan {
    Address address;
    Mode mode = Mode::Read;
    std::vector<PlannedStage> stages;
    std::vector<std::vector<std::string>> argvs;
    std::vector<std::string> warnings;
};

class Kernel {
public:
    explicit Kernel(KernelOptions options);
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Discover plugins once; later calls return the first report.
    const DiscoveryReport& load_plugins();
    // Forget the current plugin map so the next call rediscovers.
    void reload_plugins();

    PluginManager& plugins();
    const AddressResolver& resolver();
    const PipelinePlanner& planner();
    const ProfileService& profiles() const { return *profiles_; }
    const KernelOptions& options() const { return options_; }

    // Parse + plan. Throws FlowError (Syntax or Resolution).
    AddressPlan plan(const std::string& raw_address, Mode mode);

    // Process stages reading `raw_address`; empty when the address is plain
    // stdin (the caller copies it through). The last stage's stdout is a pipe.
    std::vector<PipelineStage> read_stages(const std::string& raw_address,
                                           std::vector<std::string>* warnings = nullptr);
    // Single process stage writing to `raw_address`; its stdin is a pipe.
    PipelineStage write_stage(const std::string& raw_address,
                              std::vector<std::string>* warnings = nullptr);
    // Single filter stage for `raw_address` (usually `@name?k=v`); stdin and
    // stdout are pipes.
    PipelineStage filter_stage(const std::string& raw_address,
                               const std::vector<std::string>& args = {},
                               std::vector<std::string>* warnings = nullptr);

    PipelineResult execute(const std::vector<PipelineStage>& stages) const;
    PipelineRun start(const std::vector<PipelineStage>& stages) const;

private:
    KernelOptions options_;
    PluginManager plugin_mgr_;
    std::unique_ptr<ProfileService> profiles_;
    std::unique_ptr<AddressResolver> resolver_;
    std::unique_ptr<PipelinePlanner> planner_;
    std::optional<DiscoveryReport> discovery_;
    PipelineExecutor executor_;
};

} // namespace nf
