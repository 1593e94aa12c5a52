#pragma once

// scratchpad/engine.hpp - Compile -> isolate -> execute -> reclaim, per request.
//
// STATE MACHINE (one trace event per transition, in order):
//   received -> preprocessed -> compiled.failed
//                            -> compiled.succeeded -> boundary.created -> loaded
//                               -> running -> completed | timed_out | faulted
//                               -> boundary.ended -> reclamation.polling -> done
// A compile failure goes straight to done; no boundary is created.
//
// INVARIANTS:
//   - every boundary that was created is ended before execute() returns,
//     whatever path the run took
//   - success=false always carries a non-empty error_message
//   - reclamation is queued, never awaited; its report does not touch the
//     result
//
// Engine::execute() is safe to call from several threads at once. Each call
// owns its boundary, pipes and temporary directories.

#include <memory>
#include <string>

#include "scratchpad/boundary.hpp"
#include "scratchpad/compiler.hpp"
#include "scratchpad/output.hpp"
#include "scratchpad/reclamation.hpp"
#include "scratchpad/types.hpp"

namespace scratchpad {

struct EngineOptions {
  std::string staging_root;                  // empty = private temp dir
  std::shared_ptr<CompilerBackend> backend;  // nullptr = system compiler
  ReclamationPolicy reclamation;
};

class Engine {
 public:
  Engine();
  explicit Engine(EngineOptions options);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  ExecutionResult execute(const std::string& source_text, const ScriptConfig& config,
                          OutputObserver* observer = nullptr);
  ExecutionResult execute(const ExecutionRequest& request, OutputObserver* observer = nullptr);

  // Compile only. Used by `scratchpad compile`.
  CompilationOutcome compile(const std::string& source_text, const ScriptConfig& config,
                             const std::string& source_name = "script.cpp");

  BoundaryManager& boundaries() { return boundaries_; }
  ReclamationVerifier& verifier() { return verifier_; }

 private:
  BoundaryManager boundaries_;
  CompilerFrontend frontend_;
  ReclamationVerifier verifier_;
};

// JSON renderings used by the CLI. Keys are sorted (jsonlite objects).
std::string diagnostic_to_json(const Diagnostic& d);
std::string execution_result_to_json(const ExecutionResult& r, bool include_trace = false);

}  // namespace scratchpad
