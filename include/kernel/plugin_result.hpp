// Kernel plugin discovery result and skip reporting structures
#pragma once

#include <string>
#include <vector>

#include "nf_types.hpp"

namespace nf {

struct DiscoverySkip {
  std::string path;    // candidate file that was passed over
  std::string reason;  // e.g. "no metadata block", "duplicate plugin name"
};

struct DiscoveryReport {
  int scanned = 0;
  int loaded = 0;
  int reused = 0;  // served from the cache without re-extraction
  std::vector<DiscoverySkip> skipped;
  bool cache_loaded = false;  // a readable cache of the current version existed
  bool cache_written = false;
  std::vector<std::string> errors;  // recovered I/O problems (root, cache)
};

}  // namespace nf
