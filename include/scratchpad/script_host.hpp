#pragma once

// scratchpad/script_host.hpp - Surface compiled scripts program against.
//
// Header-only. Included first by every scaffold, so everything here is
// visible to the user's body:
//
//   System.out(x)        write x (anything streamable) as one output fragment
//   System.outln(x)      same, followed by '\n'
//   dump(x, "label")     report x as a structured value; returns x
//   ConnectionString     static member of the holder type, injected by the host
//   load_native("name")  dlopen handle for a native library found through
//                        the boundary's probing paths, or nullptr
//
// The entry method returns ReturnValue. `return 42;` and `return "text";`
// both work; falling off the end of the body reports no return value.
//
// Nothing in this header links against the engine. The only channel back
// to the host is the scratchpad_host_api table bound at load time.

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "scratchpad/host_api.h"

namespace scratchpad {

namespace detail {

inline const scratchpad_host_api* g_host = nullptr;

inline int bind_host(const scratchpad_host_api* api) {
  if (!api || api->abi_version != SCRATCHPAD_HOST_ABI_VERSION) return 1;
  g_host = api;
  return 0;
}

template <typename T, typename = void>
struct is_streamable : std::false_type {};
template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template <typename T, typename = void>
struct is_range : std::false_type {};
template <typename T>
struct is_range<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

inline std::string demangle(const char* mangled) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> out(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  return (status == 0 && out) ? std::string(out.get()) : std::string(mangled);
}

template <typename T>
std::string type_name() {
  return demangle(typeid(T).name());
}

template <typename T>
std::string render(const T& value) {
  if constexpr (std::is_same_v<T, bool>) {
    return value ? "true" : "false";
  } else if constexpr (is_streamable<T>::value) {
    std::ostringstream o;
    o << value;
    return o.str();
  } else if constexpr (is_range<T>::value) {
    std::string out = "[";
    bool first = true;
    for (const auto& item : value) {
      if (!first) out += ", ";
      first = false;
      out += render(item);
    }
    out += "]";
    return out;
  } else {
    return "<" + type_name<T>() + ">";
  }
}

inline void write(const std::string& text) {
  if (g_host && g_host->write && !text.empty()) g_host->write(g_host->ctx, text.data(), text.size());
}

}  // namespace detail

class ReturnValue {
 public:
  ReturnValue() = default;

  template <typename T,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, ReturnValue>>>
  ReturnValue(const T& value)
      : has_value_(true), type_name_(detail::type_name<T>()), text_(detail::render(value)) {}

  ReturnValue(const char* value)
      : has_value_(value != nullptr), type_name_("std::string"), text_(value ? value : "") {}

  bool has_value() const { return has_value_; }
  const std::string& type_name() const { return type_name_; }
  const std::string& text() const { return text_; }

 private:
  bool has_value_{false};
  std::string type_name_;
  std::string text_;
};

struct SystemSurface {
  template <typename T>
  void out(const T& value) const {
    detail::write(detail::render(value));
  }
  void out(const char* value) const { detail::write(value ? value : ""); }

  template <typename T>
  void outln(const T& value) const {
    detail::write(detail::render(value) + "\n");
  }
  void outln(const char* value) const { detail::write(std::string(value ? value : "") + "\n"); }
  void outln() const { detail::write("\n"); }
};

inline const SystemSurface System{};

template <typename T>
const T& dump(const T& value, const std::string& label = "") {
  if (detail::g_host && detail::g_host->dump) {
    const std::string type = detail::type_name<T>();
    const std::string text = detail::render(value);
    detail::g_host->dump(detail::g_host->ctx, label.c_str(), type.c_str(), text.c_str());
  }
  return value;
}

inline void* load_native(const std::string& name) {
  if (!detail::g_host || !detail::g_host->load_native) return nullptr;
  return detail::g_host->load_native(detail::g_host->ctx, name.c_str());
}

namespace detail {

inline void report_return(const ReturnValue& value) {
  if (value.has_value() && g_host && g_host->set_return) {
    g_host->set_return(g_host->ctx, value.type_name().c_str(), value.text().c_str());
  }
}

}  // namespace detail

}  // namespace scratchpad

#define SCRATCHPAD_EXPORT_ENTRY(Holder, Entry, Property)                                  \
  extern "C" __attribute__((visibility("default"))) unsigned scratchpad_scaffold_version() { \
    return SCRATCHPAD_SCAFFOLD_VERSION;                                                     \
  }                                                                                         \
  extern "C" __attribute__((visibility("default"))) int scratchpad_bind_host(               \
      const scratchpad_host_api* api) {                                                     \
    return ::scratchpad::detail::bind_host(api);                                            \
  }                                                                                         \
  extern "C" __attribute__((visibility("default"))) void                                    \
      scratchpad_##Holder##_set_##Property(const char* value) {                             \
    ::scratchpad_script::Holder::Property = value ? value : "";                             \
  }                                                                                         \
  extern "C" __attribute__((visibility("default"))) void scratchpad_##Holder##_##Entry() {  \
    ::scratchpad::detail::report_return(::scratchpad_script::Holder::Entry());              \
  }
