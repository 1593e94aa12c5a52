#pragma once

// scratchpad/sandbox.hpp - Child process spawning with pipes and rlimits.
//
// Two consumers:
//   1. The compiler backend: run_process() runs the C++ compiler to
//      completion with a bounded wait and captured stdout/stderr.
//   2. The execution coordinator: spawn_process() starts the host runner
//      inside a boundary and hands back the pipe ends so the caller can
//      stream frames while the child is still running.
//
// CHILD SETUP (POSIX):
//   - new session / process group when new_process_group=true, so that
//     kill_process_group() also reaches anything the script forked.
//   - stdout -> pipe, stderr -> pipe, and when frame_channel=true a third
//     pipe whose write end is installed at kFrameFd (fd 3).
//   - every pipe is close-on-exec, so concurrent spawns never inherit each
//     other's descriptors (EOF on one run's pipe is not delayed by another).
//   - RLIMIT_AS / RLIMIT_NOFILE applied when requested.
//
// The argv/envp arrays are built before fork(); the child only calls
// async-signal-safe functions between fork() and exec.

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace scratchpad {

constexpr int kFrameFd = 3;

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;
  // Added to (or overriding) the inherited environment when inherit_env=true.
  std::map<std::string, std::string> env;
  bool inherit_env{true};
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{1024 * 1024};
  std::uint64_t max_memory_bytes{0};      // 0 = unlimited
  std::uint64_t max_file_descriptors{0};  // 0 = unlimited
  bool new_process_group{true};
  bool frame_channel{false};
};

struct ProcessResult {
  int exit_code{0};
  int term_signal{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // non-empty when the process could not be started
};

struct SpawnedProcess {
  pid_t pid{-1};
  int stdout_fd{-1};
  int stderr_fd{-1};
  int frame_fd{-1};
  std::string error_message;

  bool ok() const { return pid > 0; }
};

// Locate `command` on PATH unless it already contains a '/'. Returns "" when not found.
std::string resolve_executable(const std::string& command);

ProcessResult run_process(const ProcessSpec& spec);

SpawnedProcess spawn_process(const ProcessSpec& spec);

// Close every parent-side pipe end still open on `proc`.
void close_process_fds(SpawnedProcess& proc);

// now + timeout_ms, clamped to time_point::max() instead of overflowing.
std::chrono::steady_clock::time_point deadline_after(std::uint64_t timeout_ms);

// SIGKILL the process group led by `pid` (and `pid` itself). Never blocks.
void kill_process_group(pid_t pid);

// Translate a waitpid() status into an exit code (128 + signal for signals).
int decode_wait_status(int status, int* term_signal);

// Append at most `limit - dst.size()` bytes; sets `truncated` when bytes were dropped.
void append_limited(std::string& dst, const char* src, std::size_t n,
                    std::size_t limit, bool& truncated);

}  // namespace scratchpad
