#pragma once

// scratchpad/version.hpp - Version constants for every cross-process surface.
//
// Three things cross a boundary between separately built pieces of code:
//   1. The scaffold a script image is compiled into. The image exports
//      scratchpad_scaffold_version(); the host runner refuses an image whose
//      value differs from SCAFFOLD_VERSION.
//   2. The host API table (host_api.h) the runner hands to the image.
//   3. The NDJSON frames the runner writes back on the frame channel, and the
//      dependency manifest staged next to each image.
//
// INVARIANT:
//   All version constants are compile-time. The runner checks the image and
//   the coordinator checks the runner's hello frame before trusting anything
//   else either side says.

#include <cstdint>
#include <string>

#include "scratchpad/host_api.h"

namespace scratchpad {
namespace version {

// ---------------------------------------------------------------------------
// SCAFFOLD_VERSION
// Bump when the wrapper text around the user body changes in a way that
// alters exported symbol names or their signatures.
// ---------------------------------------------------------------------------
constexpr uint32_t SCAFFOLD_VERSION = SCRATCHPAD_SCAFFOLD_VERSION;

// ---------------------------------------------------------------------------
// HOST_ABI_VERSION
// Bump when scratchpad_host_api (host_api.h) changes layout.
// ---------------------------------------------------------------------------
constexpr uint32_t HOST_ABI_VERSION = SCRATCHPAD_HOST_ABI_VERSION;

// ---------------------------------------------------------------------------
// PROTOCOL_FRAMING_VERSION
// Version 1 = {type, ...} frames: hello/out/dump/return/fault/boundary_error.
// Adding or removing required fields in any frame type requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

// ---------------------------------------------------------------------------
// DEPENDENCY_MANIFEST_VERSION
// Version 1 = {"version":1,"dependencies":{name:path}} in unit.deps.json.
// ---------------------------------------------------------------------------
constexpr uint32_t DEPENDENCY_MANIFEST_VERSION = 1;

struct VersionManifest {
  uint32_t scaffold{SCAFFOLD_VERSION};
  uint32_t host_abi{HOST_ABI_VERSION};
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  uint32_t dependency_manifest{DEPENDENCY_MANIFEST_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Compare versions reported by a peer (runner hello frame or image export)
// against the ones compiled into this binary. Never throws.
CompatibilityResult check_compatibility(uint32_t peer_protocol_version,
                                        uint32_t peer_scaffold_version = SCAFFOLD_VERSION);

}  // namespace version
}  // namespace scratchpad
