#include "scratchpad/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <variant>

#include "scratchpad/jsonlite.hpp"

namespace scratchpad {

namespace {

enum class KeyType { string, u64, boolean, string_array, string_map };

const std::map<std::string, KeyType>& known_keys() {
  static const std::map<std::string, KeyType> keys = {
      {"default_imports", KeyType::string_array},
      {"packages", KeyType::string_map},
      {"references", KeyType::string_array},
      {"connection_string", KeyType::string},
      {"timeout_ms", KeyType::u64},
      {"compile_timeout_ms", KeyType::u64},
      {"package_cache_root", KeyType::string},
      {"probing_paths", KeyType::string_array},
      {"max_output_bytes", KeyType::u64},
      {"max_memory_bytes", KeyType::u64},
      {"terminate_on_timeout", KeyType::boolean},
      {"compiler", KeyType::string},
      {"extra_compiler_flags", KeyType::string_array},
  };
  return keys;
}

bool has_type(const jsonlite::Value& value, KeyType type) {
  switch (type) {
    case KeyType::string:
      return std::holds_alternative<std::string>(value.v);
    case KeyType::u64:
      return std::holds_alternative<std::uint64_t>(value.v);
    case KeyType::boolean:
      return std::holds_alternative<bool>(value.v);
    case KeyType::string_array: {
      if (!std::holds_alternative<jsonlite::Array>(value.v)) return false;
      for (const auto& item : std::get<jsonlite::Array>(value.v)) {
        if (!std::holds_alternative<std::string>(item.v)) return false;
      }
      return true;
    }
    case KeyType::string_map: {
      if (!std::holds_alternative<jsonlite::Object>(value.v)) return false;
      for (const auto& [k, item] : std::get<jsonlite::Object>(value.v)) {
        if (!std::holds_alternative<std::string>(item.v)) return false;
      }
      return true;
    }
  }
  return false;
}

ConfigValidationResult validate_object(const jsonlite::Object& obj) {
  ConfigValidationResult r;
  const auto& keys = known_keys();
  for (const auto& [key, value] : obj) {
    auto it = keys.find(key);
    if (it == keys.end()) {
      r.warnings.push_back("unknown_key:" + key);
      continue;
    }
    if (!has_type(value, it->second)) {
      r.errors.push_back("wrong_type:" + key);
    }
  }
  for (const char* key : {"timeout_ms", "compile_timeout_ms", "max_output_bytes"}) {
    auto it = obj.find(key);
    if (it != obj.end() && std::holds_alternative<std::uint64_t>(it->second.v) &&
        std::get<std::uint64_t>(it->second.v) == 0) {
      r.errors.push_back(std::string("must_be_positive:") + key);
    }
  }
  for (const char* key : {"timeout_ms", "compile_timeout_ms"}) {
    auto it = obj.find(key);
    if (it != obj.end() && std::holds_alternative<std::uint64_t>(it->second.v) &&
        std::get<std::uint64_t>(it->second.v) > kMaxTimeoutMs) {
      r.errors.push_back(std::string("must_be_at_most:") + key);
    }
  }
  r.ok = r.errors.empty();
  return r;
}

jsonlite::Value string_array(const std::vector<std::string>& items) {
  jsonlite::Array a;
  for (const auto& s : items) a.emplace_back(s);
  return jsonlite::Value(std::move(a));
}

}  // namespace

ConfigLoadResult parse_config_json(const std::string& config_json) {
  ConfigLoadResult out;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    out.error_code = to_string(ErrorCode::config_invalid);
    out.error_message = err->code + ": " + err->message;
    return out;
  }

  const auto validation = validate_object(obj);
  if (!validation.ok) {
    out.error_code = to_string(ErrorCode::config_invalid);
    out.error_message = validation.errors.front();
    return out;
  }

  ScriptConfig& c = out.config;
  if (obj.contains("default_imports")) c.default_imports = jsonlite::get_string_array(obj, "default_imports");
  c.packages = jsonlite::get_string_map(obj, "packages");
  c.references = jsonlite::get_string_array(obj, "references");
  c.connection_string = jsonlite::get_string(obj, "connection_string", "");
  c.timeout_ms = jsonlite::get_u64(obj, "timeout_ms", c.timeout_ms);
  c.compile_timeout_ms = jsonlite::get_u64(obj, "compile_timeout_ms", c.compile_timeout_ms);
  c.package_cache_root = jsonlite::get_string(obj, "package_cache_root", "");
  c.probing_paths = jsonlite::get_string_array(obj, "probing_paths");
  c.max_output_bytes = static_cast<std::size_t>(
      jsonlite::get_u64(obj, "max_output_bytes", c.max_output_bytes));
  c.max_memory_bytes = jsonlite::get_u64(obj, "max_memory_bytes", c.max_memory_bytes);
  c.terminate_on_timeout = jsonlite::get_bool(obj, "terminate_on_timeout", c.terminate_on_timeout);
  c.compiler = jsonlite::get_string(obj, "compiler", "");
  c.extra_compiler_flags = jsonlite::get_string_array(obj, "extra_compiler_flags");
  out.ok = true;
  return out;
}

ConfigLoadResult load_config_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    ConfigLoadResult out;
    out.error_code = to_string(ErrorCode::config_invalid);
    out.error_message = "cannot read config file: " + path;
    return out;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return parse_config_json(text);
}

void apply_env_overrides(ScriptConfig& config) {
  if (const char* v = std::getenv("SCRATCHPAD_TIMEOUT_MS"); v && v[0]) {
    char* end = nullptr;
    const unsigned long long ms = std::strtoull(v, &end, 10);
    if (end && *end == '\0' && ms > 0 && ms <= kMaxTimeoutMs) config.timeout_ms = ms;
  }
  if (const char* v = std::getenv("SCRATCHPAD_PACKAGE_CACHE"); v && v[0]) {
    config.package_cache_root = v;
  }
  if (const char* v = std::getenv("SCRATCHPAD_CONNECTION_STRING"); v && v[0]) {
    config.connection_string = v;
  }
  if (config.compiler.empty()) {
    if (const char* v = std::getenv("CXX"); v && v[0]) config.compiler = v;
  }
}

ConfigValidationResult validate_config(const std::string& config_json) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    ConfigValidationResult r;
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }
  return validate_object(obj);
}

std::string config_to_json(const ScriptConfig& c) {
  jsonlite::Object o;
  o["default_imports"] = string_array(c.default_imports);
  jsonlite::Object packages;
  for (const auto& [name, version] : c.packages) packages[name] = jsonlite::Value(version);
  o["packages"] = jsonlite::Value(std::move(packages));
  o["references"] = string_array(c.references);
  // The connection string may carry credentials.
  o["connection_string"] = jsonlite::Value(c.connection_string.empty() ? "" : "<redacted>");
  o["timeout_ms"] = jsonlite::Value(c.timeout_ms);
  o["compile_timeout_ms"] = jsonlite::Value(c.compile_timeout_ms);
  o["package_cache_root"] = jsonlite::Value(c.package_cache_root);
  o["probing_paths"] = string_array(c.probing_paths);
  o["max_output_bytes"] = jsonlite::Value(static_cast<std::uint64_t>(c.max_output_bytes));
  o["max_memory_bytes"] = jsonlite::Value(c.max_memory_bytes);
  o["terminate_on_timeout"] = jsonlite::Value(c.terminate_on_timeout);
  o["compiler"] = jsonlite::Value(effective_compiler(c));
  o["extra_compiler_flags"] = string_array(c.extra_compiler_flags);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

std::string effective_compiler(const ScriptConfig& config) {
  if (!config.compiler.empty()) return config.compiler;
  if (const char* v = std::getenv("CXX"); v && v[0]) return v;
  return "c++";
}

}  // namespace scratchpad
