#include "scratchpad/version.hpp"

#include "scratchpad/jsonlite.hpp"

#ifndef SCRATCHPAD_VERSION_STRING
#define SCRATCHPAD_VERSION_STRING "0.1.0"
#endif

namespace scratchpad {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver   = engine_semver.empty() ? SCRATCHPAD_VERSION_STRING : engine_semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["scaffold"] = jsonlite::Value(static_cast<std::uint64_t>(m.scaffold));
  o["host_abi"] = jsonlite::Value(static_cast<std::uint64_t>(m.host_abi));
  o["protocol_framing"] = jsonlite::Value(static_cast<std::uint64_t>(m.protocol_framing));
  o["dependency_manifest"] = jsonlite::Value(static_cast<std::uint64_t>(m.dependency_manifest));
  o["engine_semver"] = jsonlite::Value(m.engine_semver);
  o["hash_primitive"] = jsonlite::Value(m.hash_primitive);
  o["build_timestamp"] = jsonlite::Value(m.build_timestamp);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

CompatibilityResult check_compatibility(uint32_t peer_protocol_version,
                                        uint32_t peer_scaffold_version) {
  CompatibilityResult r;
  if (peer_protocol_version != PROTOCOL_FRAMING_VERSION) {
    r.ok          = false;
    r.error_code  = "protocol_error";
    r.description = "Runner protocol version " + std::to_string(peer_protocol_version) +
                    " != coordinator protocol version " +
                    std::to_string(PROTOCOL_FRAMING_VERSION) + ".";
    return r;
  }
  if (peer_scaffold_version != SCAFFOLD_VERSION) {
    r.ok          = false;
    r.error_code  = "image_invalid";
    r.description = "Image scaffold version " + std::to_string(peer_scaffold_version) +
                    " != host scaffold version " + std::to_string(SCAFFOLD_VERSION) +
                    ". Recompile the script.";
  }
  return r;
}

}  // namespace version
}  // namespace scratchpad
