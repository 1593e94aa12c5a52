#include "scratchpad/engine.hpp"

#include <chrono>

#include "scratchpad/config.hpp"
#include "scratchpad/executor.hpp"
#include "scratchpad/hash.hpp"
#include "scratchpad/jsonlite.hpp"
#include "scratchpad/observability.hpp"
#include "scratchpad/preprocessor.hpp"
#include "scratchpad/references.hpp"

namespace scratchpad {

namespace {

using Clock = std::chrono::steady_clock;

class TraceRecorder {
 public:
  explicit TraceRecorder(std::vector<TraceEvent>& out) : out_(out), start_(Clock::now()) {}

  void emit(const std::string& type, std::map<std::string, std::string> data = {}) {
    TraceEvent ev;
    ev.seq = out_.size();
    ev.t_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_).count());
    ev.type = type;
    ev.data = std::move(data);
    out_.push_back(std::move(ev));
  }

 private:
  std::vector<TraceEvent>& out_;
  Clock::time_point start_;
};

// Ends the boundary on every path out of execute() and queues the weak
// reference for reclamation.
class BoundaryScope {
 public:
  BoundaryScope(BoundaryManager& boundaries, ReclamationVerifier& verifier,
                BoundaryHandle handle, bool terminate, TraceRecorder& trace)
      : boundaries_(boundaries), verifier_(verifier), handle_(handle),
        terminate_(terminate), trace_(trace) {}

  ~BoundaryScope() {
    EndResult ended = boundaries_.end(handle_, terminate_);
    if (!ended.status.ok) return;
    trace_.emit("boundary.ended", {{"boundary_id", ended.ref.boundary_id},
                                   {"pid", std::to_string(ended.ref.pid)}});
    trace_.emit("reclamation.polling", {{"boundary_id", ended.ref.boundary_id}});
    verifier_.verify(std::move(ended.ref));
  }

  BoundaryScope(const BoundaryScope&) = delete;
  BoundaryScope& operator=(const BoundaryScope&) = delete;

 private:
  BoundaryManager& boundaries_;
  ReclamationVerifier& verifier_;
  BoundaryHandle handle_;
  bool terminate_;
  TraceRecorder& trace_;
};

std::string outcome_state(const ExecutionResult& r) {
  if (r.success) return "completed";
  if (r.timed_out) return "timed_out";
  return "faulted";
}

void record(const ExecutionResult& r, const std::string& src_digest) {
  ExecutionEvent ev;
  ev.boundary_id = r.boundary_id;
  ev.source_digest = src_digest;
  ev.image_digest = r.image_digest;
  ev.duration_ns = r.metrics.total_duration_ns;
  ev.compile_ns = r.metrics.compile_duration_ns;
  ev.run_ns = r.metrics.run_duration_ns;
  ev.bytes_source = r.metrics.bytes_source;
  ev.bytes_image = r.metrics.bytes_image;
  ev.bytes_output = r.metrics.bytes_output;
  ev.ok = r.success;
  ev.timed_out = r.timed_out;
  ev.error_code = r.error_code;
  emit_execution_event(ev);
}

}  // namespace

Engine::Engine() : Engine(EngineOptions{}) {}

Engine::Engine(EngineOptions options)
    : boundaries_(options.staging_root),
      frontend_(options.backend),
      verifier_(options.reclamation) {}

CompilationOutcome Engine::compile(const std::string& source_text, const ScriptConfig& config,
                                   const std::string& source_name) {
  const PreprocessedSource pre = preprocess(source_text);
  const CompilationUnit unit = make_compilation_unit(pre, config, source_name);
  return frontend_.compile(unit, resolve_references(config), config);
}

ExecutionResult Engine::execute(const std::string& source_text, const ScriptConfig& config,
                                OutputObserver* observer) {
  ExecutionRequest request;
  request.source_text = source_text;
  request.config = config;
  return execute(request, observer);
}

ExecutionResult Engine::execute(const ExecutionRequest& request, OutputObserver* observer) {
  ExecutionResult result;
  std::vector<TraceEvent> trace;
  TraceRecorder tr(trace);
  const auto started = Clock::now();
  const ScriptConfig& config = request.config;
  const std::string src_digest = source_digest(request.source_text);

  auto finish = [&](ExecutionResult r) {
    r.metrics.total_duration_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started).count());
    r.metrics.bytes_source = request.source_text.size();
    if (!r.success && (!r.error_message || r.error_message->empty())) {
      r.error_message = r.error_code.empty() ? "Execution failed" : "Execution failed: " + r.error_code;
    }
    tr.emit("done", {{"success", r.success ? "true" : "false"}});
    r.trace_events = std::move(trace);
    record(r, src_digest);
    return r;
  };

  tr.emit("received", {{"source_digest", src_digest}});

  const PreprocessedSource pre = preprocess(request.source_text);
  const CompilationUnit unit = make_compilation_unit(pre, config, request.source_name);
  tr.emit("preprocessed", {{"removed_lines", std::to_string(pre.removed_line_count)},
                           {"imports", std::to_string(unit.imports.size())}});

  const ReferenceSet refs = resolve_references(config);
  if (!refs.ok) {
    result.error_code = refs.error_code;
    result.error_message = refs.error_message;
    tr.emit("compiled.failed", {{"error_code", refs.error_code}});
    return finish(std::move(result));
  }

  CompilationOutcome outcome = frontend_.compile(unit, refs, config);
  result.metrics.compile_duration_ns = outcome.compile_duration_ns;
  if (!outcome.succeeded()) {
    result.diagnostics = std::move(outcome.diagnostics);
    result.error_code = outcome.error_code.empty() ? to_string(ErrorCode::compilation_failed)
                                                   : outcome.error_code;
    if (result.error_code == to_string(ErrorCode::compiler_unavailable)) {
      result.error_message = "Compiler unavailable: " +
                             (result.diagnostics.empty() ? effective_compiler(config)
                                                         : result.diagnostics.front().message);
    } else {
      result.error_message = "Compilation failed with " + std::to_string(result.diagnostics.size()) +
                             " diagnostic(s)";
    }
    tr.emit("compiled.failed", {{"diagnostics", std::to_string(result.diagnostics.size())}});
    return finish(std::move(result));
  }
  result.image_digest = outcome.image_digest;
  result.metrics.bytes_image = outcome.image->size();
  tr.emit("compiled.succeeded", {{"image_digest", outcome.image_digest},
                                 {"entry_point", outcome.entry_point}});

  const BoundaryHandle boundary = boundaries_.create(config.probing_paths);
  result.boundary_id = boundary.id();
  tr.emit("boundary.created", {{"boundary_id", result.boundary_id}});

  ExecutionResult run;
  {
    BoundaryScope scope(boundaries_, verifier_, boundary, config.terminate_on_timeout, tr);

    LoadResult loaded = boundaries_.load(boundary, outcome);
    if (!loaded.status.ok) {
      result.error_code = loaded.status.error_code;
      result.error_message = "Boundary error: " + loaded.status.error_message;
      tr.emit("faulted", {{"error_code", result.error_code}});
    } else {
      tr.emit("loaded", {{"image", loaded.unit.image_path}});
      tr.emit("running", {{"timeout_ms", std::to_string(config.timeout_ms)}});
      Executor executor(boundaries_);
      run = executor.run(boundary, loaded.unit, outcome.entry_point, config, observer);
      tr.emit(outcome_state(run), {{"error_code", run.error_code}});
    }
  }

  if (!result.error_code.empty()) return finish(std::move(result));

  run.diagnostics = std::move(outcome.diagnostics);
  run.metrics.compile_duration_ns = result.metrics.compile_duration_ns;
  run.metrics.bytes_image = result.metrics.bytes_image;
  run.boundary_id = result.boundary_id;
  run.image_digest = result.image_digest;
  return finish(std::move(run));
}

namespace {

jsonlite::Value diagnostic_value(const Diagnostic& d) {
  jsonlite::Object o;
  o["severity"] = jsonlite::Value(to_string(d.severity));
  o["code"] = jsonlite::Value(d.code);
  o["message"] = jsonlite::Value(d.message);
  o["line"] = jsonlite::Value(static_cast<std::uint64_t>(d.line));
  o["column"] = jsonlite::Value(static_cast<std::uint64_t>(d.column));
  o["in_user_code"] = jsonlite::Value(d.in_user_code);
  return jsonlite::Value(std::move(o));
}

jsonlite::Value optional_string(const std::optional<std::string>& s) {
  return s ? jsonlite::Value(*s) : jsonlite::Value(nullptr);
}

}  // namespace

std::string diagnostic_to_json(const Diagnostic& d) {
  return jsonlite::to_json(diagnostic_value(d));
}

std::string execution_result_to_json(const ExecutionResult& r, bool include_trace) {
  jsonlite::Object o;
  o["success"] = jsonlite::Value(r.success);
  o["output"] = jsonlite::Value(r.output);
  o["output_truncated"] = jsonlite::Value(r.output_truncated);
  o["error_message"] = optional_string(r.error_message);
  o["error_code"] = jsonlite::Value(r.error_code);
  o["timed_out"] = jsonlite::Value(r.timed_out);
  o["boundary_id"] = jsonlite::Value(r.boundary_id);
  o["image_digest"] = jsonlite::Value(r.image_digest);

  if (r.return_value) {
    jsonlite::Object rv;
    rv["type"] = jsonlite::Value(r.return_value->type_name);
    rv["text"] = jsonlite::Value(r.return_value->text);
    o["return_value"] = jsonlite::Value(std::move(rv));
  } else {
    o["return_value"] = jsonlite::Value(nullptr);
  }
  if (r.error_cause) {
    jsonlite::Object c;
    c["kind"] = jsonlite::Value(r.error_cause->kind);
    c["type"] = jsonlite::Value(r.error_cause->type_name);
    c["message"] = jsonlite::Value(r.error_cause->message);
    c["detail"] = jsonlite::Value(r.error_cause->detail);
    o["error_cause"] = jsonlite::Value(std::move(c));
  } else {
    o["error_cause"] = jsonlite::Value(nullptr);
  }

  jsonlite::Array diags;
  for (const auto& d : r.diagnostics) diags.push_back(diagnostic_value(d));
  o["diagnostics"] = jsonlite::Value(std::move(diags));

  jsonlite::Array dumps;
  for (const auto& d : r.dumps) {
    jsonlite::Object dv;
    dv["label"] = jsonlite::Value(d.label);
    dv["type"] = jsonlite::Value(d.type_name);
    dv["text"] = jsonlite::Value(d.text);
    dumps.push_back(jsonlite::Value(std::move(dv)));
  }
  o["dumps"] = jsonlite::Value(std::move(dumps));

  jsonlite::Object m;
  m["total_ns"] = jsonlite::Value(r.metrics.total_duration_ns);
  m["compile_ns"] = jsonlite::Value(r.metrics.compile_duration_ns);
  m["run_ns"] = jsonlite::Value(r.metrics.run_duration_ns);
  m["bytes_source"] = jsonlite::Value(static_cast<std::uint64_t>(r.metrics.bytes_source));
  m["bytes_image"] = jsonlite::Value(static_cast<std::uint64_t>(r.metrics.bytes_image));
  m["bytes_output"] = jsonlite::Value(static_cast<std::uint64_t>(r.metrics.bytes_output));
  m["output_fragments"] = jsonlite::Value(static_cast<std::uint64_t>(r.metrics.output_fragments));
  o["metrics"] = jsonlite::Value(std::move(m));

  if (include_trace) {
    jsonlite::Array trace;
    for (const auto& ev : r.trace_events) {
      jsonlite::Object t;
      t["seq"] = jsonlite::Value(ev.seq);
      t["t_ns"] = jsonlite::Value(ev.t_ns);
      t["type"] = jsonlite::Value(ev.type);
      jsonlite::Object data;
      for (const auto& [k, v] : ev.data) data[k] = jsonlite::Value(v);
      t["data"] = jsonlite::Value(std::move(data));
      trace.push_back(jsonlite::Value(std::move(t)));
    }
    o["trace"] = jsonlite::Value(std::move(trace));
  }
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

}  // namespace scratchpad
