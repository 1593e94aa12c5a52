#pragma once

// scratchpad/config.hpp - ScriptConfig loading, env overrides and validation.
//
// Sources, later ones win:
//   1. ScriptConfig defaults (types.hpp)
//   2. a JSON config file (strict jsonlite parse, duplicate keys rejected)
//   3. environment overrides:
//        SCRATCHPAD_TIMEOUT_MS        -> timeout_ms
//        SCRATCHPAD_PACKAGE_CACHE     -> package_cache_root
//        SCRATCHPAD_CONNECTION_STRING -> connection_string
//        CXX                          -> compiler (only when compiler is unset)

#include <cstdint>
#include <string>
#include <vector>

#include "scratchpad/types.hpp"

namespace scratchpad {

// Upper bound for timeout_ms and compile_timeout_ms (24 hours). Larger
// values are rejected by validation and ignored as env overrides.
inline constexpr std::uint64_t kMaxTimeoutMs = 24ULL * 60 * 60 * 1000;

struct ConfigLoadResult {
  bool ok{false};
  ScriptConfig config;
  std::string error_code;
  std::string error_message;
};

ConfigLoadResult parse_config_json(const std::string& config_json);
ConfigLoadResult load_config_file(const std::string& path);

void apply_env_overrides(ScriptConfig& config);

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Unknown keys are warnings. Wrong types, zero timeouts and timeouts above
// kMaxTimeoutMs are errors.
ConfigValidationResult validate_config(const std::string& config_json);

std::string config_to_json(const ScriptConfig& config);

// Effective compiler command: config.compiler, else $CXX, else "c++".
std::string effective_compiler(const ScriptConfig& config);

}  // namespace scratchpad
