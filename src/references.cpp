#include "scratchpad/references.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <system_error>

#ifndef SCRATCHPAD_INCLUDE_DIR
#define SCRATCHPAD_INCLUDE_DIR ""
#endif

namespace scratchpad {

namespace fs = std::filesystem;

namespace {

const std::vector<std::string>& system_library_dirs() {
  static const std::vector<std::string> dirs = {
      "/usr/local/lib",
#if defined(__x86_64__)
      "/usr/lib/x86_64-linux-gnu", "/lib/x86_64-linux-gnu",
#elif defined(__aarch64__)
      "/usr/lib/aarch64-linux-gnu", "/lib/aarch64-linux-gnu",
#elif defined(__arm__)
      "/usr/lib/arm-linux-gnueabihf", "/lib/arm-linux-gnueabihf",
#endif
      "/usr/lib64", "/lib64", "/usr/lib", "/lib",
#if defined(__APPLE__)
      "/opt/homebrew/lib",
#endif
  };
  return dirs;
}

bool is_binary_name(const std::string& file) {
  auto ends_with = [&file](const std::string& suffix) {
    return file.size() >= suffix.size() &&
           file.compare(file.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (ends_with(".so") || ends_with(".dylib") || ends_with(".dll")) return true;
  // Versioned sonames: libfoo.so.1, libfoo.so.1.2.3
  return file.find(".so.") != std::string::npos;
}

bool has_ref_segment(const fs::path& relative) {
  for (const auto& part : relative) {
    if (part == "ref") return true;
  }
  return false;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool is_regular(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

bool is_directory(const fs::path& p) {
  std::error_code ec;
  return fs::is_directory(p, ec);
}

ReferenceSet compute_baseline() {
  ReferenceSet set;
  const auto v = validate_baseline();
  if (!v.ok) {
    set.error_code = to_string(ErrorCode::baseline_unavailable);
    set.error_message = v.error_message;
    return set;
  }
  set.references.push_back(Reference{ReferenceKind::include_dir, "scratchpad", v.include_dir, true});
  set.references.push_back(Reference{ReferenceKind::link_flag, "pthread", "-pthread", true});
  set.references.push_back(Reference{ReferenceKind::link_flag, "m", "-lm", true});
  set.ok = true;
  return set;
}

}  // namespace

std::string to_string(ReferenceKind kind) {
  switch (kind) {
    case ReferenceKind::include_dir: return "include_dir";
    case ReferenceKind::library: return "library";
    case ReferenceKind::link_flag: return "link_flag";
  }
  return "unknown";
}

std::string host_include_dir() {
  if (const char* v = std::getenv("SCRATCHPAD_INCLUDE_DIR"); v && v[0]) return v;
  return SCRATCHPAD_INCLUDE_DIR;
}

BaselineValidation validate_baseline() {
  BaselineValidation v;
  v.include_dir = host_include_dir();
  if (v.include_dir.empty()) {
    v.error_message = "host include directory is not configured";
    return v;
  }
  if (!is_regular(fs::path(v.include_dir) / "scratchpad" / "script_host.hpp")) {
    v.error_message = "host include directory lacks scratchpad/script_host.hpp: " + v.include_dir;
    return v;
  }
  v.ok = true;
  return v;
}

const ReferenceSet& baseline_references() {
  static std::once_flag once;
  static ReferenceSet baseline;
  std::call_once(once, [] { baseline = compute_baseline(); });
  return baseline;
}

std::string package_cache_root(const ScriptConfig& config) {
  if (!config.package_cache_root.empty()) return config.package_cache_root;
  if (const char* v = std::getenv("SCRATCHPAD_PACKAGE_CACHE"); v && v[0]) return v;
  const char* home = std::getenv("HOME");
  return (fs::path(home && home[0] ? home : ".") / ".package-cache").string();
}

std::vector<std::string> get_package_binaries(const std::string& cache_root,
                                              const std::string& name,
                                              const std::string& version) {
  std::vector<std::string> out;
  const fs::path lib_root = fs::path(cache_root) / lowercase(name) / version / "lib";
  if (!scratchpad::is_directory(lib_root)) return out;

  std::error_code ec;
  fs::recursive_directory_iterator it(lib_root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec) && !it->is_symlink(ec)) continue;
    const fs::path& p = it->path();
    if (!is_binary_name(p.filename().string())) continue;
    if (has_ref_segment(p.lexically_relative(lib_root))) continue;
    out.push_back(p.string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string find_system_library(const std::string& name) {
  if (name.empty()) return {};
  const fs::path as_path(name);
  if (as_path.is_absolute()) {
    return is_regular(as_path) ? name : std::string{};
  }
  const std::vector<std::string> candidates = {"lib" + name + ".so", "lib" + name + ".dylib",
                                               name + ".dll"};
  for (const auto& dir : system_library_dirs()) {
    for (const auto& c : candidates) {
      const fs::path p = fs::path(dir) / c;
      if (is_regular(p)) return p.string();
    }
  }
  return {};
}

ReferenceSet resolve_references(const ScriptConfig& config) {
  const ReferenceSet& baseline = baseline_references();
  if (!baseline.ok) return baseline;

  ReferenceSet set = baseline;

  for (const auto& name : config.references) {
    const std::string path = find_system_library(name);
    if (path.empty()) {
      set.skipped.push_back(name);
      continue;
    }
    set.references.push_back(Reference{ReferenceKind::library, name, path, false});
  }

  const std::string root = package_cache_root(config);
  for (const auto& [name, version] : config.packages) {
    const fs::path version_dir = fs::path(root) / lowercase(name) / version;
    const auto binaries = get_package_binaries(root, name, version);
    const bool has_include = scratchpad::is_directory(version_dir / "include");
    if (binaries.empty() && !has_include) {
      set.skipped.push_back(name + "@" + version);
      continue;
    }
    if (has_include) {
      set.references.push_back(
          Reference{ReferenceKind::include_dir, name, (version_dir / "include").string(), false});
    }
    for (const auto& bin : binaries) {
      set.references.push_back(Reference{ReferenceKind::library, name, bin, false});
    }
  }
  return set;
}

std::string canonical_reference_list(const ReferenceSet& refs) {
  std::string out;
  for (const auto& r : refs.references) {
    out += to_string(r.kind);
    out += '\t';
    out += r.name;
    out += '\t';
    out += r.path;
    out += '\n';
  }
  return out;
}

}  // namespace scratchpad
