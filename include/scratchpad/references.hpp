#pragma once

// scratchpad/references.hpp - Reference set assembly for the compiler backend.
//
// A ReferenceSet is the ordered union of:
//   1. BASELINE: the host include directory (so scaffolded code can include
//      <scratchpad/script_host.hpp>) and the runtime link flags every image
//      needs (-pthread for std::async/std::thread, -lm). Computed once per
//      process behind std::call_once and immutable afterwards. This is the
//      only state shared between requests.
//   2. CONFIGURED: library names from ScriptConfig::references, looked up
//      as lib<n>.so / lib<n>.dylib / <n>.dll in the system library
//      directories, or taken as-is when absolute. Best effort: misses are
//      recorded in ReferenceSet::skipped.
//   3. PACKAGES: for every (name, version) in ScriptConfig::packages,
//      <cache-root>/<lowercase name>/<version>/lib/**/<binary>, skipping any
//      path with a segment named "ref", in sorted order, plus
//      <version>/include when present. Recomputed per request.
//
// Baseline failure is fatal (baseline_unavailable) and is returned by every
// resolve_references() call; it is never swallowed.

#include <string>
#include <vector>

#include "scratchpad/types.hpp"

namespace scratchpad {

// Host include dir: $SCRATCHPAD_INCLUDE_DIR, else the directory compiled in
// as SCRATCHPAD_INCLUDE_DIR.
std::string host_include_dir();

const ReferenceSet& baseline_references();

struct BaselineValidation {
  bool ok{false};
  std::string include_dir;
  std::string error_message;
};
BaselineValidation validate_baseline();

ReferenceSet resolve_references(const ScriptConfig& config);

// config.package_cache_root, else $SCRATCHPAD_PACKAGE_CACHE, else
// $HOME/.package-cache.
std::string package_cache_root(const ScriptConfig& config);

// Binaries of one cached package version. Empty when the package is absent.
std::vector<std::string> get_package_binaries(const std::string& cache_root,
                                              const std::string& name,
                                              const std::string& version);

// Locate a configured reference. Returns "" when not found.
std::string find_system_library(const std::string& name);

// Stable text form used for digests and the CLI.
std::string canonical_reference_list(const ReferenceSet& refs);

std::string to_string(ReferenceKind kind);

}  // namespace scratchpad
