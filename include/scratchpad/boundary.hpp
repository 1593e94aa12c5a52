#pragma once

// scratchpad/boundary.hpp - Isolation boundaries and per-boundary dependency loaders.
//
// MODEL:
//   A boundary is a slot in the BoundaryManager registry. Callers hold a
//   BoundaryHandle {slot, generation}; the registry holds everything else:
//     - a private staging directory (images + unit.deps.json),
//     - the probing paths used by both loaders,
//     - at most one boundary process (the host runner) once launched.
//   Ending a boundary retires its generation. Every later call through the
//   same handle fails with stale_boundary instead of touching whatever the
//   slot holds next.
//
// LOADERS (evaluated inside the boundary process, scoped to that process):
//   managed: dependency manifest entry -> <probe>/<name>.so -> default linker
//   native:  manifest entry -> <probe>/runtimes/<rid>/native/<cand>
//            -> <probe>/<cand> -> default loader, first match wins
//
// CONCURRENCY:
//   The registry is mutex-protected; distinct boundaries never share state.
//   end() never blocks on the boundary process. Reaping and staging cleanup
//   belong to the ReclamationVerifier.

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "scratchpad/sandbox.hpp"
#include "scratchpad/types.hpp"

namespace scratchpad {

// ---------------------------------------------------------------------------
// Runtime identifier and native candidate names
// ---------------------------------------------------------------------------
enum class OsFamily { gnu_linux, windows, macos };
enum class CpuArch { x64, x86, arm64, arm, other };

OsFamily host_os_family();
CpuArch host_cpu_arch();

// linux-x64, linux-arm64, linux-arm, win-x64, win-x86, win-arm64, osx-x64,
// osx-arm64. Unknown combinations fall back to the family's x64 RID.
std::string make_runtime_identifier(OsFamily os, CpuArch arch);

// Detected once per process.
const std::string& runtime_identifier();

std::vector<std::string> native_candidate_names(const std::string& name, OsFamily os);

// Returns "" when the default loader should decide.
std::string resolve_native_path(const std::string& name,
                                const DependencyManifest& manifest,
                                const std::vector<std::string>& probing_paths,
                                const std::string& rid, OsFamily os);

std::string resolve_managed_path(const std::string& name,
                                 const DependencyManifest& manifest,
                                 const std::vector<std::string>& probing_paths);

// ---------------------------------------------------------------------------
// Dependency manifest (unit.deps.json)
// ---------------------------------------------------------------------------
std::string dependency_manifest_to_json(const DependencyManifest& manifest);
std::optional<DependencyManifest> parse_dependency_manifest(const std::string& json,
                                                            std::string* error);
std::optional<DependencyManifest> read_dependency_manifest(const std::string& path,
                                                           std::string* error);

// True when `image` starts with the shared-object magic of this platform.
bool image_matches_platform(const std::string& image);

// ---------------------------------------------------------------------------
// BoundaryManager
// ---------------------------------------------------------------------------
struct BoundaryStatus {
  bool ok{false};
  std::string error_code;
  std::string error_message;
};

struct LoadResult {
  BoundaryStatus status;
  LoadedUnit unit;
};

struct LaunchResult {
  BoundaryStatus status;
  SpawnedProcess process;
};

struct EndResult {
  BoundaryStatus status;
  BoundaryWeakRef ref;
};

class BoundaryManager {
 public:
  // staging_root empty = a fresh directory under the system temp dir.
  explicit BoundaryManager(std::string staging_root = "");
  ~BoundaryManager();

  BoundaryManager(const BoundaryManager&) = delete;
  BoundaryManager& operator=(const BoundaryManager&) = delete;

  BoundaryHandle create(const std::vector<std::string>& probing_paths);

  LoadResult load(const BoundaryHandle& handle, const CompilationOutcome& outcome);

  // Starts the boundary process. The caller owns the returned pipe ends.
  LaunchResult launch(const BoundaryHandle& handle, const ProcessSpec& spec);

  // Records that the caller reaped the boundary process.
  BoundaryStatus mark_exited(const BoundaryHandle& handle);

  // Severs the boundary. terminate=true SIGKILLs a still-running process
  // group; false abandons it. Never waits.
  EndResult end(const BoundaryHandle& handle, bool terminate = true);

  bool is_live(const BoundaryHandle& handle) const;
  std::optional<std::vector<std::string>> probing_paths(const BoundaryHandle& handle) const;
  std::optional<std::string> staging_dir(const BoundaryHandle& handle) const;
  std::size_t live_count() const;
  const std::string& staging_root() const { return staging_root_; }

 private:
  struct Slot {
    std::uint32_t generation{0};
    bool live{false};
    std::string staging_dir;
    std::vector<std::string> probing_paths;
    std::vector<std::string> images;
    pid_t pid{-1};
    bool exited{false};
  };

  Slot* find_locked(const BoundaryHandle& handle);
  const Slot* find_locked(const BoundaryHandle& handle) const;
  static BoundaryStatus stale(const BoundaryHandle& handle);

  std::string staging_root_;
  bool owns_root_{false};
  mutable std::mutex mu_;
  std::vector<Slot> slots_;
  std::vector<std::uint32_t> free_slots_;
};

}  // namespace scratchpad
