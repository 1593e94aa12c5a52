#include "scratchpad/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "scratchpad/jsonlite.hpp"

namespace scratchpad {

namespace {

// std::bit_width is floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed(double v, const char* fmt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

void append_jsonl(const std::string& line) {
  const char* log_path = std::getenv("SCRATCHPAD_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fputc('\n', f);
    std::fclose(f);
  }
}

std::atomic<ExecutionEventHook> g_execution_hook{nullptr};
std::atomic<ReclamationEventHook> g_reclamation_hook{nullptr};

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":" + fixed(mean_us(), "%.2f");
  out += ",\"p50_ms\":" + fixed(percentile(0.50) / 1000.0, "%.3f");
  out += ",\"p95_ms\":" + fixed(percentile(0.95) / 1000.0, "%.3f");
  out += ",\"p99_ms\":" + fixed(percentile(0.99) / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_execution(const ExecutionEvent& ev) {
  total_executions.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    successful_executions.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_executions.fetch_add(1, std::memory_order_relaxed);
  }

  if (ev.error_code == to_string(ErrorCode::compilation_failed)) {
    compilation_failures.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == to_string(ErrorCode::timeout)) {
    timeouts.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == to_string(ErrorCode::runtime_fault)) {
    runtime_faults.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.error_code == to_string(ErrorCode::boundary_error) ||
             ev.error_code == to_string(ErrorCode::image_invalid) ||
             ev.error_code == to_string(ErrorCode::stale_boundary)) {
    boundary_errors.fetch_add(1, std::memory_order_relaxed);
  }

  latency_histogram.record(ev.duration_ns);
  if (ev.compile_ns > 0) compile_histogram.record(ev.compile_ns);

  if (!ev.error_code.empty()) {
    std::lock_guard<std::mutex> lk(failure_mu_);
    ++failure_categories_[ev.error_code];
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

void EngineStats::record_reclamation(const ReclamationEvent& ev) {
  if (ev.state == ReclamationState::collected) {
    reclamations_collected.fetch_add(1, std::memory_order_relaxed);
  } else {
    reclamations_still_reachable.fetch_add(1, std::memory_order_relaxed);
  }
}

std::vector<ExecutionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<ExecutionEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::map<std::string, std::uint64_t> EngineStats::failure_categories() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failure_categories_;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(768);
  out += "{\"total_executions\":";
  out += std::to_string(total_executions.load(std::memory_order_relaxed));
  out += ",\"successful_executions\":";
  out += std::to_string(successful_executions.load(std::memory_order_relaxed));
  out += ",\"failed_executions\":";
  out += std::to_string(failed_executions.load(std::memory_order_relaxed));
  out += ",\"compilation_failures\":";
  out += std::to_string(compilation_failures.load(std::memory_order_relaxed));
  out += ",\"timeouts\":";
  out += std::to_string(timeouts.load(std::memory_order_relaxed));
  out += ",\"runtime_faults\":";
  out += std::to_string(runtime_faults.load(std::memory_order_relaxed));
  out += ",\"boundary_errors\":";
  out += std::to_string(boundary_errors.load(std::memory_order_relaxed));

  out += ",\"reclamation\":{\"collected\":";
  out += std::to_string(reclamations_collected.load(std::memory_order_relaxed));
  out += ",\"still_reachable\":";
  out += std::to_string(reclamations_still_reachable.load(std::memory_order_relaxed));
  out += "}";

  out += ",\"latency\":";
  out += latency_histogram.to_json();
  out += ",\"compile_latency\":";
  out += compile_histogram.to_json();

  out += ",\"failure_categories\":{";
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    bool first = true;
    for (const auto& [code, n] : failure_categories_) {
      if (!first) out += ',';
      first = false;
      out += "\"" + jsonlite::escape(code) + "\":" + std::to_string(n);
    }
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

void set_execution_event_hook(ExecutionEventHook hook) {
  g_execution_hook.store(hook, std::memory_order_release);
}

void set_reclamation_event_hook(ReclamationEventHook hook) {
  g_reclamation_hook.store(hook, std::memory_order_release);
}

std::string execution_event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["event"] = jsonlite::Value("execution");
  o["boundary_id"] = jsonlite::Value(ev.boundary_id);
  o["source_digest"] = jsonlite::Value(ev.source_digest);
  o["image_digest"] = jsonlite::Value(ev.image_digest);
  o["ok"] = jsonlite::Value(ev.ok);
  o["timed_out"] = jsonlite::Value(ev.timed_out);
  o["error_code"] = jsonlite::Value(ev.error_code);
  o["duration_ns"] = jsonlite::Value(ev.duration_ns);
  o["compile_ns"] = jsonlite::Value(ev.compile_ns);
  o["run_ns"] = jsonlite::Value(ev.run_ns);
  o["bytes_source"] = jsonlite::Value(static_cast<std::uint64_t>(ev.bytes_source));
  o["bytes_image"] = jsonlite::Value(static_cast<std::uint64_t>(ev.bytes_image));
  o["bytes_output"] = jsonlite::Value(static_cast<std::uint64_t>(ev.bytes_output));
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

std::string reclamation_event_to_json(const ReclamationEvent& ev) {
  jsonlite::Object o;
  o["event"] = jsonlite::Value("reclamation");
  o["boundary_id"] = jsonlite::Value(ev.boundary_id);
  o["attempts"] = jsonlite::Value(static_cast<std::uint64_t>(ev.attempts));
  o["state"] = jsonlite::Value(to_string(ev.state));
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

void emit_execution_event(const ExecutionEvent& ev) {
  global_engine_stats().record_execution(ev);

  ExecutionEventHook hook = g_execution_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }
  append_jsonl(execution_event_to_json(ev));
}

void emit_reclamation_event(const ReclamationEvent& ev) {
  global_engine_stats().record_reclamation(ev);

  ReclamationEventHook hook = g_reclamation_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }
  append_jsonl(reclamation_event_to_json(ev));
}

}  // namespace scratchpad
