#pragma once

// scratchpad/types.hpp - Core data structures for the scratchpad execution engine.
//
// ARCHITECTURE NOTES:
//
// PIPELINE:
//   ExecutionRequest -> PreprocessedSource -> CompilationUnit -> CompilationOutcome
//   -> BoundaryHandle / LoadedUnit -> ExecutionResult -> ReclamationReport.
//   Every stage consumes the previous stage's value and produces a new one.
//   Nothing is shared between two requests except the baseline reference cache.
//
// MEMORY OWNERSHIP:
//   - All members are value-owned. No borrowed references, no raw pointers.
//   - CompilationOutcome owns the image bytes until the boundary stages them.
//   - ExecutionResult is returned by value. Caller owns it.
//
// CONCURRENCY NOTES:
//   - ScriptConfig is read-only once a request is submitted; safe to share
//     between concurrent execute() calls.
//   - BoundaryHandle is a plain {slot, generation} pair. It carries no
//     ownership; the BoundaryManager registry decides whether it is live.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scratchpad {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  config_invalid,
  baseline_unavailable,
  compiler_unavailable,
  compilation_failed,
  image_invalid,
  stale_boundary,
  boundary_error,
  runner_unavailable,
  protocol_error,
  timeout,
  runtime_fault,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// ScriptConfig - per-request configuration
// ---------------------------------------------------------------------------
struct ScriptConfig {
  // Headers included ahead of user imports, in order.
  std::vector<std::string> default_imports{"iostream", "string", "vector", "map",
                                           "algorithm", "memory", "future"};
  // Package name -> version, resolved against the package cache layout.
  std::map<std::string, std::string> packages;
  // Configured reference names (library names such as "m" or "z", or absolute paths).
  std::vector<std::string> references;
  std::string connection_string;
  std::uint64_t timeout_ms{30000};
  std::uint64_t compile_timeout_ms{60000};

  std::string package_cache_root;       // empty = $SCRATCHPAD_PACKAGE_CACHE or ~/.package-cache
  std::vector<std::string> probing_paths;
  std::size_t max_output_bytes{1024 * 1024};
  std::uint64_t max_memory_bytes{0};    // 0 = unlimited
  // When false a timed-out boundary process is abandoned, not killed. The
  // reclamation verifier then reports it as still reachable.
  bool terminate_on_timeout{true};
  std::string compiler;                 // empty = $CXX or "c++"
  std::vector<std::string> extra_compiler_flags;
};

struct ExecutionRequest {
  std::string source_text;
  ScriptConfig config;
  std::string source_name{"script.cpp"};
};

// ---------------------------------------------------------------------------
// Preprocessing / compilation values
// ---------------------------------------------------------------------------
struct PreprocessedSource {
  std::string body;
  std::vector<std::string> imports;  // order preserved, duplicates allowed
  std::size_t removed_line_count{0};
};

struct CompilationUnit {
  std::string body;
  std::vector<std::string> imports;  // config defaults first, then user imports, de-duplicated
  std::size_t removed_line_count{0};
  std::string source_name{"script.cpp"};
};

enum class Severity { note, warning, error };

std::string to_string(Severity severity);

struct Diagnostic {
  Severity severity{Severity::error};
  std::string code;
  std::string message;
  std::size_t line{0};
  std::size_t column{0};
  bool in_user_code{true};
};

enum class ReferenceKind { include_dir, library, link_flag };

struct Reference {
  ReferenceKind kind{ReferenceKind::library};
  std::string name;
  std::string path;  // include dir or library file; for link_flag the flag itself
  bool baseline{false};
};

struct ReferenceSet {
  bool ok{false};
  std::string error_code;
  std::string error_message;
  std::vector<Reference> references;
  std::vector<std::string> skipped;  // best-effort entries that could not be resolved
};

// Ordered managed dependency name -> resolved path, written next to the image.
struct DependencyManifest {
  std::vector<std::pair<std::string, std::string>> entries;
};

struct CompilationOutcome {
  std::vector<Diagnostic> diagnostics;
  std::string error_code;            // compilation_failed or compiler_unavailable when image is unset
  std::optional<std::string> image;  // shared object bytes
  std::string entry_point;           // "Script.Main" when image is set
  std::string image_digest;
  DependencyManifest dependencies;
  std::uint64_t compile_duration_ns{0};

  bool succeeded() const { return image.has_value(); }
};

// ---------------------------------------------------------------------------
// Boundary values
// ---------------------------------------------------------------------------
struct BoundaryHandle {
  std::uint32_t slot{0};
  std::uint32_t generation{0};

  bool valid() const { return generation != 0; }
  std::string id() const;
};

struct LoadedUnit {
  BoundaryHandle boundary;
  std::string image_path;
  std::string manifest_path;
  std::string image_digest;
};

// Non-owning back-reference used only for reclamation polling.
struct BoundaryWeakRef {
  std::string boundary_id;
  std::int64_t pid{0};       // 0 = boundary never started a process
  std::string staging_dir;
};

// ---------------------------------------------------------------------------
// Execution result
// ---------------------------------------------------------------------------
struct ReturnDescriptor {
  std::string type_name;
  std::string text;
};

struct ErrorCause {
  std::string kind;       // "exception", "nested_exception", "signal", "boundary", "timeout"
  std::string type_name;  // exception type or signal name
  std::string message;
  std::string detail;     // outer exception message for unwrapped nested exceptions
};

struct DumpRecord {
  std::string label;
  std::string type_name;
  std::string text;
};

struct TraceEvent {
  std::uint64_t seq{0};
  std::uint64_t t_ns{0};
  std::string type;
  std::map<std::string, std::string> data;
};

struct ExecutionMetrics {
  std::uint64_t total_duration_ns{0};
  std::uint64_t compile_duration_ns{0};
  std::uint64_t run_duration_ns{0};
  std::size_t bytes_source{0};
  std::size_t bytes_image{0};
  std::size_t bytes_output{0};
  std::size_t output_fragments{0};
};

struct ExecutionResult {
  bool success{false};
  std::string output;
  std::optional<ReturnDescriptor> return_value;
  std::optional<std::string> error_message;
  std::optional<ErrorCause> error_cause;
  std::string error_code;
  bool timed_out{false};
  bool output_truncated{false};
  std::vector<Diagnostic> diagnostics;
  std::vector<DumpRecord> dumps;
  std::string boundary_id;
  std::string image_digest;
  std::vector<TraceEvent> trace_events;
  ExecutionMetrics metrics;
};

// ---------------------------------------------------------------------------
// Reclamation
// ---------------------------------------------------------------------------
enum class ReclamationState { collected, still_reachable };

std::string to_string(ReclamationState state);

struct ReclamationReport {
  std::string boundary_id;
  std::uint32_t attempts{0};
  ReclamationState state{ReclamationState::still_reachable};
};

}  // namespace scratchpad
