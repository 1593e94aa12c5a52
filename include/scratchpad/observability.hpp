#pragma once

// scratchpad/observability.hpp - Engine counters, latency histogram and event log.
//
// DESIGN:
//   Two observable units:
//     - ExecutionEvent: one per Engine::execute() call, whatever the outcome.
//     - ReclamationEvent: one per verifier pass over an ended boundary.
//   Both are recorded into the process-wide EngineStats, handed to an
//   optional hook, and otherwise appended as JSONL to $SCRATCHPAD_EVENT_LOG.
//
//   Events carry digests and metadata only. Script output never leaves the
//   ExecutionResult it belongs to.
//
// EXTENSION_POINT: event_exporter
//   Current: JSONL file or in-process hook.
//   Upgrade path: forward events to a collector from a background drain of
//   the ring buffer. Invariant: emission must never block execute().

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "scratchpad/types.hpp"

namespace scratchpad {

struct ExecutionEvent {
  std::string boundary_id;
  std::string source_digest;
  std::string image_digest;

  std::uint64_t duration_ns{0};
  std::uint64_t compile_ns{0};
  std::uint64_t run_ns{0};

  std::size_t bytes_source{0};
  std::size_t bytes_image{0};
  std::size_t bytes_output{0};

  bool ok{false};
  bool timed_out{false};
  std::string error_code;
};

struct ReclamationEvent {
  std::string boundary_id;
  std::uint32_t attempts{0};
  ReclamationState state{ReclamationState::still_reachable};
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats - process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the failure map and ring use mutexes.
// Exposed by `scratchpad stats` and `scratchpad health`.
class EngineStats {
 public:
  void record_execution(const ExecutionEvent& ev);
  void record_reclamation(const ReclamationEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<std::uint64_t> total_executions{0};
  alignas(64) std::atomic<std::uint64_t> successful_executions{0};
  alignas(64) std::atomic<std::uint64_t> failed_executions{0};
  std::atomic<std::uint64_t> compilation_failures{0};
  std::atomic<std::uint64_t> timeouts{0};
  std::atomic<std::uint64_t> runtime_faults{0};
  std::atomic<std::uint64_t> boundary_errors{0};

  std::atomic<std::uint64_t> reclamations_collected{0};
  std::atomic<std::uint64_t> reclamations_still_reachable{0};

  LatencyHistogram latency_histogram;
  LatencyHistogram compile_histogram;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<ExecutionEvent> recent_events_snapshot() const;
  std::map<std::string, std::uint64_t> failure_categories() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, std::uint64_t> failure_categories_;

  // ring_head_ is the next slot to overwrite once the ring is full.
  mutable std::mutex ring_mu_;
  std::vector<ExecutionEvent> ring_buffer_;
  size_t ring_head_{0};
};

EngineStats& global_engine_stats();

// Non-blocking, fire-and-forget. Activation of the JSONL sink:
// SCRATCHPAD_EVENT_LOG=/path/to/events.jsonl
void emit_execution_event(const ExecutionEvent& ev);
void emit_reclamation_event(const ReclamationEvent& ev);

using ExecutionEventHook = void (*)(const ExecutionEvent&);
using ReclamationEventHook = void (*)(const ReclamationEvent&);
void set_execution_event_hook(ExecutionEventHook hook);
void set_reclamation_event_hook(ReclamationEventHook hook);

std::string execution_event_to_json(const ExecutionEvent& ev);
std::string reclamation_event_to_json(const ReclamationEvent& ev);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace scratchpad
