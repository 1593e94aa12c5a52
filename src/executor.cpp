#include "scratchpad/executor.hpp"

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <thread>

#include "scratchpad/compiler.hpp"
#include "scratchpad/observability.hpp"
#include "scratchpad/sandbox.hpp"
#include "scratchpad/version.hpp"
#include "scratchpad/wire.hpp"

#ifndef SCRATCHPAD_HOST_RUNNER_PATH
#define SCRATCHPAD_HOST_RUNNER_PATH "scratchpad-host"
#endif

namespace scratchpad {

namespace {

constexpr std::size_t kMaxStderrBytes = 64 * 1024;

using Clock = std::chrono::steady_clock;

// Per-run state while frames are drained.
struct RunState {
  explicit RunState(std::size_t max_output, OutputObserver* observer) : sink(max_output, observer) {}

  OutputSink sink;
  FrameReader frames;
  std::string stderr_text;
  bool stderr_truncated{false};
  bool hello{false};
  bool done{false};
  std::optional<ReturnDescriptor> return_value;
  std::optional<ErrorCause> fault;
  std::optional<std::string> boundary_error;
  std::optional<std::string> protocol_error;
  std::vector<DumpRecord> dumps;
};

void handle_frame(RunState& st, const Frame& f) {
  switch (f.type) {
    case FrameType::hello: {
      const auto compat = version::check_compatibility(static_cast<std::uint32_t>(f.protocol));
      if (!compat.ok) st.protocol_error = compat.description;
      st.hello = true;
      break;
    }
    case FrameType::out:
      st.sink.write(f.text);
      break;
    case FrameType::dump: {
      DumpRecord d{f.label, f.type_name, f.text};
      st.sink.structured(d);
      st.dumps.push_back(std::move(d));
      break;
    }
    case FrameType::ret:
      st.return_value = ReturnDescriptor{f.type_name, f.text};
      break;
    case FrameType::fault:
      st.fault = ErrorCause{f.kind, f.type_name, f.message, f.detail};
      break;
    case FrameType::boundary_error:
      st.boundary_error = f.message;
      break;
    case FrameType::done:
      st.done = true;
      break;
  }
}

// Reads what is available on `fd`. Returns false on EOF or error (fd closed).
bool drain_fd(int& fd, RunState& st, int which) {
  char buf[8192];
  const ssize_t got = ::read(fd, buf, sizeof(buf));
  if (got < 0 && (errno == EINTR || errno == EAGAIN)) return true;
  if (got <= 0) {
    ::close(fd);
    fd = -1;
    return false;
  }
  const std::size_t n = static_cast<std::size_t>(got);
  if (which == 0) {
    st.frames.feed(buf, n);
    Frame f;
    while (true) {
      std::string err;
      if (st.frames.next(f, &err)) {
        handle_frame(st, f);
      } else if (!err.empty()) {
        st.protocol_error = err;
      } else {
        break;
      }
    }
  } else if (which == 1) {
    // Raw writes to the process's stdout (printf, puts) bypass the frame
    // channel. The runner leaves stdout unbuffered, so they arrive even when
    // the script later faults or times out, but they are not ordered
    // against frames.
    st.sink.write(std::string(buf, n));
  } else {
    append_limited(st.stderr_text, buf, n, kMaxStderrBytes, st.stderr_truncated);
  }
  return true;
}

void pump(SpawnedProcess& proc, RunState& st, int timeout_ms) {
  pollfd fds[3];
  int* owners[3];
  int which[3];
  nfds_t n = 0;
  if (proc.frame_fd >= 0) { fds[n] = pollfd{proc.frame_fd, POLLIN, 0}; owners[n] = &proc.frame_fd; which[n++] = 0; }
  if (proc.stdout_fd >= 0) { fds[n] = pollfd{proc.stdout_fd, POLLIN, 0}; owners[n] = &proc.stdout_fd; which[n++] = 1; }
  if (proc.stderr_fd >= 0) { fds[n] = pollfd{proc.stderr_fd, POLLIN, 0}; owners[n] = &proc.stderr_fd; which[n++] = 2; }
  if (n == 0) return;
  const int ready = ::poll(fds, n, timeout_ms);
  if (ready <= 0) return;
  // Frames first so an out frame is never overtaken by raw output read in
  // the same wakeup.
  for (nfds_t k = 0; k < n; ++k) {
    if (fds[k].revents & (POLLIN | POLLHUP | POLLERR)) drain_fd(*owners[k], st, which[k]);
  }
}

bool all_closed(const SpawnedProcess& proc) {
  return proc.frame_fd < 0 && proc.stdout_fd < 0 && proc.stderr_fd < 0;
}

std::string fault_message(const ErrorCause& cause) {
  if (cause.message.empty()) return cause.type_name.empty() ? "Script faulted" : cause.type_name;
  return cause.message;
}

}  // namespace

std::string host_runner_path() {
  if (const char* v = std::getenv("SCRATCHPAD_HOST_RUNNER"); v && v[0]) return v;
  return SCRATCHPAD_HOST_RUNNER_PATH;
}

bool split_entry_point(const std::string& entry_point, std::string& holder, std::string& entry) {
  const auto dot = entry_point.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 >= entry_point.size()) return false;
  holder = entry_point.substr(0, dot);
  entry = entry_point.substr(dot + 1);
  return true;
}

std::string describe_signal(int signo) {
  switch (signo) {
    case SIGFPE: return "Attempted to divide by zero or other arithmetic fault (SIGFPE)";
    case SIGSEGV: return "Invalid memory access (SIGSEGV)";
    case SIGBUS: return "Bus error (SIGBUS)";
    case SIGILL: return "Illegal instruction (SIGILL)";
    case SIGABRT: return "Script aborted (SIGABRT)";
    case SIGKILL: return "Boundary process was killed (SIGKILL)";
    default: return "Boundary process terminated by signal " + std::to_string(signo);
  }
}

std::string signal_name(int signo) {
  switch (signo) {
    case SIGFPE: return "SIGFPE";
    case SIGSEGV: return "SIGSEGV";
    case SIGBUS: return "SIGBUS";
    case SIGILL: return "SIGILL";
    case SIGABRT: return "SIGABRT";
    case SIGKILL: return "SIGKILL";
    case SIGTERM: return "SIGTERM";
    case SIGXCPU: return "SIGXCPU";
    default: return "signal " + std::to_string(signo);
  }
}

ExecutionResult Executor::run(const BoundaryHandle& boundary, const LoadedUnit& unit,
                              const std::string& entry_point, const ScriptConfig& config,
                              OutputObserver* observer) {
  ExecutionResult result;
  result.boundary_id = boundary.id();
  result.image_digest = unit.image_digest;
  ScopeTimer run_timer(result.metrics.run_duration_ns);

  auto fail = [&result](ErrorCode code, std::string message) {
    result.success = false;
    result.error_code = to_string(code);
    result.error_message = std::move(message);
  };

  std::string holder, entry;
  if (!split_entry_point(entry_point, holder, entry)) {
    fail(ErrorCode::boundary_error, "Boundary error: malformed entry point '" + entry_point + "'");
    result.error_cause = ErrorCause{"boundary", "", *result.error_message, ""};
    return result;
  }
  const auto probes = boundaries_.probing_paths(boundary);
  if (!probes) {
    fail(ErrorCode::stale_boundary, "Boundary error: boundary " + boundary.id() + " has ended");
    return result;
  }

  ProcessSpec spec;
  spec.command = host_runner_path();
  spec.argv = {"--image", unit.image_path, "--manifest", unit.manifest_path,
               "--holder", holder, "--entry", entry, "--property", kConnectionProperty};
  for (const auto& p : *probes) {
    spec.argv.push_back("--probe");
    spec.argv.push_back(p);
  }
  // Kept out of argv so it never shows up in process listings.
  spec.env["SCRATCHPAD_BOUNDARY_CONNECTION_STRING"] = config.connection_string;
  spec.max_memory_bytes = config.max_memory_bytes;
  spec.max_output_bytes = config.max_output_bytes;

  LaunchResult launched = boundaries_.launch(boundary, spec);
  if (!launched.status.ok) {
    const ErrorCode code = launched.status.error_code == to_string(ErrorCode::stale_boundary)
                               ? ErrorCode::stale_boundary
                               : ErrorCode::runner_unavailable;
    fail(code, "Boundary error: " + launched.status.error_message);
    return result;
  }
  SpawnedProcess& proc = launched.process;

  RunState st(config.max_output_bytes, observer);
  const auto deadline = deadline_after(config.timeout_ms);
  int status = 0;
  bool reaped = false;

  while (true) {
    const auto now = Clock::now();
    if (now >= deadline) break;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    if (!all_closed(proc)) {
      pump(proc, st, static_cast<int>(std::min<long long>(left, 50)));
      continue;
    }
    // Every pipe is closed; the runner is exiting.
    const pid_t w = ::waitpid(proc.pid, &status, WNOHANG);
    if (w == proc.pid || (w < 0 && errno == ECHILD)) {
      reaped = w == proc.pid;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(std::min<long long>(left, 5)));
  }

  if (!reaped && all_closed(proc)) {
    const pid_t w = ::waitpid(proc.pid, &status, WNOHANG);
    reaped = w == proc.pid;
  }
  if (!reaped) {
    // Pick up whatever was written right before the deadline.
    for (int i = 0; i < 16 && !all_closed(proc); ++i) pump(proc, st, 0);
  }
  close_process_fds(proc);
  if (reaped) boundaries_.mark_exited(boundary);

  result.dumps = std::move(st.dumps);
  result.output_truncated = st.sink.truncated();
  result.metrics.bytes_output = st.sink.bytes_seen();
  result.metrics.output_fragments = st.sink.fragments();
  result.output = st.sink.take_buffer();

  if (!reaped) {
    result.timed_out = true;
    fail(ErrorCode::timeout,
         "Script execution timed out after " + std::to_string(config.timeout_ms) + " ms");
    result.error_cause = ErrorCause{"timeout", "", *result.error_message, ""};
    return result;
  }

  int term_signal = 0;
  const int exit_code = decode_wait_status(status, &term_signal);

  if (st.protocol_error) {
    fail(ErrorCode::protocol_error, "Boundary error: " + *st.protocol_error);
    return result;
  }
  if (st.boundary_error) {
    fail(ErrorCode::boundary_error, "Boundary error: " + *st.boundary_error);
    result.error_cause = ErrorCause{"boundary", "", *st.boundary_error, st.stderr_text};
    return result;
  }
  if (st.fault) {
    if (st.fault->detail.empty() && !st.stderr_text.empty()) st.fault->detail = st.stderr_text;
    fail(ErrorCode::runtime_fault, fault_message(*st.fault));
    result.error_cause = std::move(st.fault);
    return result;
  }
  if (term_signal != 0) {
    fail(ErrorCode::runtime_fault, describe_signal(term_signal));
    result.error_cause = ErrorCause{"signal", signal_name(term_signal), *result.error_message, st.stderr_text};
    return result;
  }
  if (!st.hello) {
    fail(ErrorCode::runner_unavailable,
         "Boundary error: host runner exited with code " + std::to_string(exit_code) +
             " before the handshake" + (st.stderr_text.empty() ? "" : ": " + st.stderr_text));
    return result;
  }
  if (!st.done || exit_code != 0) {
    fail(ErrorCode::runtime_fault, "Script exited with code " + std::to_string(exit_code));
    result.error_cause = ErrorCause{"exit", "", *result.error_message, st.stderr_text};
    return result;
  }

  result.success = true;
  result.return_value = std::move(st.return_value);
  return result;
}

}  // namespace scratchpad
