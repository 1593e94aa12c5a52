#pragma once

// scratchpad/jsonlite.hpp - Minimal strict JSON value, parser and emitter.
//
// Used by three surfaces that must agree byte-for-byte:
//   - configuration files (config.hpp)
//   - the dependency manifest staged next to every image (boundary.hpp)
//   - the NDJSON runner wire protocol (wire.hpp)
//
// Objects are std::map, so emitted keys are always sorted. Parsing rejects
// duplicate keys and trailing data.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scratchpad::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse a JSON object. Returns an empty object and sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& value);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys or wrong types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

}  // namespace scratchpad::jsonlite
