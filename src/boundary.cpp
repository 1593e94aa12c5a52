#include "scratchpad/boundary.hpp"

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <variant>

#include "scratchpad/jsonlite.hpp"
#include "scratchpad/version.hpp"

namespace scratchpad {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool file_exists(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

const std::string* manifest_lookup(const DependencyManifest& manifest, const std::string& name) {
  for (const auto& [key, path] : manifest.entries) {
    if (key == name) return &path;
  }
  return nullptr;
}

bool write_text(const fs::path& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
  return static_cast<bool>(ofs);
}

}  // namespace

// ---------------------------------------------------------------------------
// Runtime identifier
// ---------------------------------------------------------------------------

OsFamily host_os_family() {
#if defined(_WIN32)
  return OsFamily::windows;
#elif defined(__APPLE__)
  return OsFamily::macos;
#else
  return OsFamily::gnu_linux;
#endif
}

CpuArch host_cpu_arch() {
#if defined(__x86_64__) || defined(_M_X64)
  return CpuArch::x64;
#elif defined(__aarch64__) || defined(_M_ARM64)
  return CpuArch::arm64;
#elif defined(__arm__) || defined(_M_ARM)
  return CpuArch::arm;
#elif defined(__i386__) || defined(_M_IX86)
  return CpuArch::x86;
#else
  return CpuArch::other;
#endif
}

std::string make_runtime_identifier(OsFamily os, CpuArch arch) {
  switch (os) {
    case OsFamily::gnu_linux:
      if (arch == CpuArch::arm64) return "linux-arm64";
      if (arch == CpuArch::arm) return "linux-arm";
      return "linux-x64";
    case OsFamily::windows:
      if (arch == CpuArch::x86) return "win-x86";
      if (arch == CpuArch::arm64) return "win-arm64";
      return "win-x64";
    case OsFamily::macos:
      if (arch == CpuArch::arm64) return "osx-arm64";
      return "osx-x64";
  }
  return "linux-x64";
}

const std::string& runtime_identifier() {
  static const std::string rid = make_runtime_identifier(host_os_family(), host_cpu_arch());
  return rid;
}

std::vector<std::string> native_candidate_names(const std::string& name, OsFamily os) {
  std::vector<std::string> out = {name};
  switch (os) {
    case OsFamily::gnu_linux:
      if (!ends_with(name, ".so")) {
        out.push_back("lib" + name + ".so");
        out.push_back(name + ".so");
      }
      break;
    case OsFamily::windows:
      if (!ends_with(name, ".dll")) out.push_back(name + ".dll");
      break;
    case OsFamily::macos:
      if (!ends_with(name, ".dylib")) {
        out.push_back("lib" + name + ".dylib");
        out.push_back(name + ".dylib");
      }
      break;
  }
  return out;
}

std::string resolve_native_path(const std::string& name, const DependencyManifest& manifest,
                                const std::vector<std::string>& probing_paths,
                                const std::string& rid, OsFamily os) {
  if (const std::string* p = manifest_lookup(manifest, name); p && file_exists(*p)) return *p;

  const auto candidates = native_candidate_names(name, os);
  for (const auto& probe : probing_paths) {
    const fs::path runtimes = fs::path(probe) / "runtimes" / rid / "native";
    for (const auto& cand : candidates) {
      if (file_exists(runtimes / cand)) return (runtimes / cand).string();
    }
    for (const auto& cand : candidates) {
      if (file_exists(fs::path(probe) / cand)) return (fs::path(probe) / cand).string();
    }
  }
  return {};
}

std::string resolve_managed_path(const std::string& name, const DependencyManifest& manifest,
                                 const std::vector<std::string>& probing_paths) {
  if (const std::string* p = manifest_lookup(manifest, name); p && file_exists(*p)) return *p;
  for (const auto& probe : probing_paths) {
    const fs::path cand = fs::path(probe) / (name + ".so");
    if (file_exists(cand)) return cand.string();
  }
  return {};
}

// ---------------------------------------------------------------------------
// Dependency manifest
// ---------------------------------------------------------------------------

std::string dependency_manifest_to_json(const DependencyManifest& manifest) {
  // Entries are stored as an array of pairs: objects would lose the order.
  jsonlite::Array deps;
  for (const auto& [name, path] : manifest.entries) {
    jsonlite::Object e;
    e["name"] = jsonlite::Value(name);
    e["path"] = jsonlite::Value(path);
    deps.emplace_back(std::move(e));
  }
  jsonlite::Object o;
  o["version"] = jsonlite::Value(static_cast<std::uint64_t>(version::DEPENDENCY_MANIFEST_VERSION));
  o["dependencies"] = jsonlite::Value(std::move(deps));
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

std::optional<DependencyManifest> parse_dependency_manifest(const std::string& json,
                                                            std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  if (jsonlite::get_u64(obj, "version", 0) != version::DEPENDENCY_MANIFEST_VERSION) {
    if (error) *error = "unsupported dependency manifest version";
    return std::nullopt;
  }
  DependencyManifest manifest;
  auto it = obj.find("dependencies");
  if (it != obj.end() && std::holds_alternative<jsonlite::Array>(it->second.v)) {
    for (const auto& item : std::get<jsonlite::Array>(it->second.v)) {
      if (!std::holds_alternative<jsonlite::Object>(item.v)) continue;
      const auto& e = std::get<jsonlite::Object>(item.v);
      manifest.entries.emplace_back(jsonlite::get_string(e, "name"), jsonlite::get_string(e, "path"));
    }
  }
  return manifest;
}

std::optional<DependencyManifest> read_dependency_manifest(const std::string& path,
                                                           std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot read dependency manifest: " + path;
    return std::nullopt;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return parse_dependency_manifest(text, error);
}

bool image_matches_platform(const std::string& image) {
  if (image.size() < 4) return false;
  const auto* b = reinterpret_cast<const unsigned char*>(image.data());
#if defined(_WIN32)
  return b[0] == 'M' && b[1] == 'Z';
#elif defined(__APPLE__)
  return (b[0] == 0xcf && b[1] == 0xfa && b[2] == 0xed && b[3] == 0xfe) ||
         (b[0] == 0xca && b[1] == 0xfe && b[2] == 0xba && b[3] == 0xbe);
#else
  return b[0] == 0x7f && b[1] == 'E' && b[2] == 'L' && b[3] == 'F';
#endif
}

// ---------------------------------------------------------------------------
// BoundaryManager
// ---------------------------------------------------------------------------

BoundaryManager::BoundaryManager(std::string staging_root) : staging_root_(std::move(staging_root)) {
  std::error_code ec;
  if (staging_root_.empty()) {
    const fs::path base = fs::temp_directory_path(ec);
    std::string tmpl = ((ec ? fs::path("/tmp") : base) / "scratchpad-boundaries-XXXXXX").string();
    if (::mkdtemp(tmpl.data())) {
      staging_root_ = tmpl;
      owns_root_ = true;
    }
  } else {
    fs::create_directories(staging_root_, ec);
  }
}

BoundaryManager::~BoundaryManager() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& slot : slots_) {
    if (slot.live && slot.pid > 0 && !slot.exited) kill_process_group(slot.pid);
  }
  if (owns_root_) {
    std::error_code ec;
    fs::remove_all(staging_root_, ec);
  }
}

BoundaryManager::Slot* BoundaryManager::find_locked(const BoundaryHandle& handle) {
  if (!handle.valid() || handle.slot >= slots_.size()) return nullptr;
  Slot& s = slots_[handle.slot];
  return (s.live && s.generation == handle.generation) ? &s : nullptr;
}

const BoundaryManager::Slot* BoundaryManager::find_locked(const BoundaryHandle& handle) const {
  if (!handle.valid() || handle.slot >= slots_.size()) return nullptr;
  const Slot& s = slots_[handle.slot];
  return (s.live && s.generation == handle.generation) ? &s : nullptr;
}

BoundaryStatus BoundaryManager::stale(const BoundaryHandle& handle) {
  BoundaryStatus st;
  st.error_code = to_string(ErrorCode::stale_boundary);
  st.error_message = "boundary " + handle.id() + " has ended or was never created";
  return st;
}

BoundaryHandle BoundaryManager::create(const std::vector<std::string>& probing_paths) {
  std::lock_guard<std::mutex> lk(mu_);
  std::uint32_t index;
  if (!free_slots_.empty()) {
    index = free_slots_.back();
    free_slots_.pop_back();
  } else {
    index = static_cast<std::uint32_t>(slots_.size());
    slots_.emplace_back();
  }
  Slot& s = slots_[index];
  ++s.generation;
  if (s.generation == 0) ++s.generation;  // 0 marks an invalid handle
  s.live = true;
  s.probing_paths = probing_paths;
  s.images.clear();
  s.pid = -1;
  s.exited = false;

  BoundaryHandle handle{index, s.generation};
  s.staging_dir = (fs::path(staging_root_) / handle.id()).string();
  std::error_code ec;
  fs::remove_all(s.staging_dir, ec);
  fs::create_directories(s.staging_dir, ec);
  return handle;
}

LoadResult BoundaryManager::load(const BoundaryHandle& handle, const CompilationOutcome& outcome) {
  LoadResult r;
  std::lock_guard<std::mutex> lk(mu_);
  Slot* s = find_locked(handle);
  if (!s) {
    r.status = stale(handle);
    return r;
  }
  if (!outcome.image || !image_matches_platform(*outcome.image)) {
    r.status.error_code = to_string(ErrorCode::image_invalid);
    r.status.error_message = "image is not a loadable shared object for this platform";
    return r;
  }

  const std::string digest = outcome.image_digest.size() >= 16 ? outcome.image_digest.substr(0, 16)
                                                                : std::to_string(s->images.size());
  const fs::path image_path = fs::path(s->staging_dir) / ("unit-" + digest + ".so");
  const fs::path manifest_path = fs::path(s->staging_dir) / "unit.deps.json";
  if (!write_text(image_path, *outcome.image) ||
      !write_text(manifest_path, dependency_manifest_to_json(outcome.dependencies))) {
    r.status.error_code = to_string(ErrorCode::boundary_error);
    r.status.error_message = "cannot stage image in " + s->staging_dir;
    return r;
  }
  s->images.push_back(image_path.string());

  r.status.ok = true;
  r.unit.boundary = handle;
  r.unit.image_path = image_path.string();
  r.unit.manifest_path = manifest_path.string();
  r.unit.image_digest = outcome.image_digest;
  return r;
}

LaunchResult BoundaryManager::launch(const BoundaryHandle& handle, const ProcessSpec& spec) {
  LaunchResult r;
  std::lock_guard<std::mutex> lk(mu_);
  Slot* s = find_locked(handle);
  if (!s) {
    r.status = stale(handle);
    return r;
  }
  if (s->pid > 0) {
    r.status.error_code = to_string(ErrorCode::boundary_error);
    r.status.error_message = "boundary " + handle.id() + " already hosts a process";
    return r;
  }
  ProcessSpec scoped = spec;
  scoped.new_process_group = true;
  scoped.frame_channel = true;
  if (scoped.cwd.empty()) scoped.cwd = s->staging_dir;
  r.process = spawn_process(scoped);
  if (!r.process.ok()) {
    r.status.error_code = to_string(ErrorCode::runner_unavailable);
    r.status.error_message = r.process.error_message;
    return r;
  }
  s->pid = r.process.pid;
  r.status.ok = true;
  return r;
}

BoundaryStatus BoundaryManager::mark_exited(const BoundaryHandle& handle) {
  std::lock_guard<std::mutex> lk(mu_);
  Slot* s = find_locked(handle);
  if (!s) return stale(handle);
  s->exited = true;
  BoundaryStatus st;
  st.ok = true;
  return st;
}

EndResult BoundaryManager::end(const BoundaryHandle& handle, bool terminate) {
  EndResult r;
  std::lock_guard<std::mutex> lk(mu_);
  Slot* s = find_locked(handle);
  if (!s) {
    r.status = stale(handle);
    return r;
  }
  const bool running = s->pid > 0 && !s->exited;
  if (running && terminate) kill_process_group(s->pid);

  r.ref.boundary_id = handle.id();
  r.ref.pid = running ? s->pid : 0;
  r.ref.staging_dir = s->staging_dir;

  s->live = false;
  s->probing_paths.clear();
  s->images.clear();
  s->pid = -1;
  free_slots_.push_back(handle.slot);
  r.status.ok = true;
  return r;
}

bool BoundaryManager::is_live(const BoundaryHandle& handle) const {
  std::lock_guard<std::mutex> lk(mu_);
  return find_locked(handle) != nullptr;
}

std::optional<std::vector<std::string>> BoundaryManager::probing_paths(const BoundaryHandle& handle) const {
  std::lock_guard<std::mutex> lk(mu_);
  const Slot* s = find_locked(handle);
  if (!s) return std::nullopt;
  return s->probing_paths;
}

std::optional<std::string> BoundaryManager::staging_dir(const BoundaryHandle& handle) const {
  std::lock_guard<std::mutex> lk(mu_);
  const Slot* s = find_locked(handle);
  if (!s) return std::nullopt;
  return s->staging_dir;
}

std::size_t BoundaryManager::live_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& s : slots_) {
    if (s.live) ++n;
  }
  return n;
}

}  // namespace scratchpad
