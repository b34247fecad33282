// ndflow kernel: metadata block extraction (never executes the candidate)
#pragma once

#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

#include "kernel/plugin_metadata.hpp"

namespace nf {

// Name of the reserved sub-table, i.e. `[tool.ndflow]`.
inline constexpr const char* kToolTable = "ndflow";

// Find the first `# /// script` ... `# ///` block in `text` and return its
// interior with the comment leader stripped. nullopt when there is none.
std::optional<std::string> find_script_block(const std::string& text);

// Parse the TOML subset used by metadata blocks into a YAML document tree.
// Throws FlowError(FlowErrc::Syntax) with a line number on malformed input.
YAML::Node parse_toml_document(const std::string& text);

// Read `file` (only its head) and build its metadata. `name` and `path` are
// taken from the file itself; role inference from the directory happens in
// discovery.
ExtractResult extract_metadata(const fs::path& file);

}  // namespace nf
