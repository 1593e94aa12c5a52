#pragma once

// scratchpad/reclamation.hpp - Post-run audit that an ended boundary was released.
//
// The verifier holds BoundaryWeakRef values only: a boundary id, the pid
// of a process that was still running at end(), and the staging directory.
// It never holds a BoundaryHandle, so it cannot keep a boundary alive or
// invoke anything through it.
//
// One pass over a weak ref, up to max_attempts times:
//   1. collection: reap the boundary process without blocking
//   2. drain: remove the staging directory
//   3. pause for poll_interval
//   4. recheck: collected when the process is gone and the directory is
//      gone; stop early on the first such observation
//
// Reports are observational: emitted as reclamation events and counted in
// EngineStats. They never change an ExecutionResult.
//
// Processes still running after the budget (abandoned boundaries, see
// ScriptConfig::terminate_on_timeout) go onto a watch list and are reaped
// by later passes.

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "scratchpad/types.hpp"

namespace scratchpad {

struct ReclamationPolicy {
  std::uint32_t max_attempts{10};
  std::chrono::milliseconds poll_interval{50};
};

class ReclamationVerifier {
 public:
  using ReportCallback = std::function<void(const ReclamationReport&)>;

  explicit ReclamationVerifier(ReclamationPolicy policy = {});
  ~ReclamationVerifier();

  ReclamationVerifier(const ReclamationVerifier&) = delete;
  ReclamationVerifier& operator=(const ReclamationVerifier&) = delete;

  // Fire-and-forget: queued for the worker thread.
  void verify(BoundaryWeakRef ref);

  // Synchronous pass on the calling thread.
  ReclamationReport verify_now(const BoundaryWeakRef& ref);

  // Invoked on the worker thread for every queued report.
  void set_report_callback(ReportCallback cb);

  // Blocks until the queue is empty and no pass is running.
  void drain();

  std::size_t watch_list_size() const;

 private:
  bool process_gone(std::int64_t pid);
  void reap_watch_list();
  void worker_loop();

  ReclamationPolicy policy_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<BoundaryWeakRef> queue_;
  std::vector<std::int64_t> watch_list_;
  ReportCallback callback_;
  bool busy_{false};
  bool stop_{false};
  std::thread worker_;
};

}  // namespace scratchpad
