#pragma once

// scratchpad/executor.hpp - Runs a loaded unit inside its boundary process.
//
// RUN SEQUENCE:
//   1. launch the host runner in the boundary (own process group, frame
//      channel on kFrameFd, rlimits from the config)
//   2. the runner maps the image, resolves Holder.Entry and the property
//      setter by symbol name, injects the connection string and the host
//      API table, then calls the entry
//   3. the coordinator drains frames, raw stdout and stderr with poll()
//      until the runner exits or the deadline passes
//
// OUTCOMES:
//   done frame, clean exit        -> success, output, return descriptor
//   deadline passed               -> "Script execution timed out after N ms"
//   fault frame / fatal signal    -> runtime_fault, fault message
//   boundary_error frame          -> boundary_error, distinct message
// Partial output is kept on every path.
//
// The executor never ends the boundary. On timeout the process is still
// running when run() returns; BoundaryManager::end() decides whether it is
// killed.

#include <string>

#include "scratchpad/boundary.hpp"
#include "scratchpad/output.hpp"
#include "scratchpad/types.hpp"

namespace scratchpad {

// $SCRATCHPAD_HOST_RUNNER, else the scratchpad-host built with this library.
std::string host_runner_path();

// Splits "Holder.Entry". Returns false when either part is missing.
bool split_entry_point(const std::string& entry_point, std::string& holder, std::string& entry);

// Human-readable message for a fatal signal raised inside the boundary.
std::string describe_signal(int signo);

// "SIGFPE", "SIGSEGV", ... or "signal <n>".
std::string signal_name(int signo);

class Executor {
 public:
  explicit Executor(BoundaryManager& boundaries) : boundaries_(boundaries) {}

  ExecutionResult run(const BoundaryHandle& boundary, const LoadedUnit& unit,
                      const std::string& entry_point, const ScriptConfig& config,
                      OutputObserver* observer = nullptr);

 private:
  BoundaryManager& boundaries_;
};

}  // namespace scratchpad
