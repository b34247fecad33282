#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kernel/address_resolver.hpp"
#include "kernel/pipeline_stage.hpp"

namespace nf {

// One plugin invocation in a plan, before endpoints are assigned.
struct PlannedStage {
  std::string plugin_name;
  std::string plugin_path;
  Mode mode = Mode::Read;
  ConfigMap config;
  std::optional<std::string> url;
  std::optional<std::map<std::string, std::string>> headers;
};

class PipelinePlanner {
 public:
  explicit PipelinePlanner(const AddressResolver& resolver) : resolver_(resolver) {}

  // Ordered invocations that read from / write to `address`:
  //  - stdin without a format override reads nothing (empty plan);
  //  - protocol reads may split into fetch (raw) + parse (read);
  //  - compressed reads get a decompression stage.
  // Non-fatal profile notes are appended to `warnings` when given.
  std::vector<PlannedStage> plan(const Address& address, Mode mode,
                                 std::vector<std::string>* warnings = nullptr) const;

 private:
  const AddressResolver& resolver_;
};

// `[runner..., path, --mode, m, --key, value..., --headers, json, url]`.
std::vector<std::string> build_argv(const PlannedStage& stage,
                                    const std::vector<std::string>& runner);

// Process stages for a read plan. The first stage reads the file for file
// addresses, the engine's stdin for stdio and nothing otherwise; the last
// stage's stdout is left as a pipe for the caller to point somewhere.
std::vector<PipelineStage> make_read_stages(const Address& address,
                                            const std::vector<PlannedStage>& plan,
                                            const std::vector<std::string>& runner);

// Process stage for a single write invocation. Its stdin is a pipe (the
// caller sets it when the stage stands alone); stdout goes to the file for
// file addresses and to the engine's stdout otherwise.
PipelineStage make_write_stage(const Address& address, const PlannedStage& stage,
                               const std::vector<std::string>& runner);

// Process stage for a filter invocation: pipes on both sides, with `args`
// appended after the generated arguments (e.g. a jq expression).
PipelineStage make_filter_stage(const PlannedStage& stage, const std::vector<std::string>& args,
                                const std::vector<std::string>& runner);

}  // namespace nf
