#ifndef _WIN32

#include "scratchpad/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

extern char** environ;

namespace scratchpad {

namespace {

bool make_pipe(int fds[2]) {
#if defined(__linux__)
  return ::pipe2(fds, O_CLOEXEC) == 0;
#else
  if (::pipe(fds) != 0) return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
#endif
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void close_pair(int fds[2]) {
  close_fd(fds[0]);
  close_fd(fds[1]);
}

std::vector<std::string> build_environment(const ProcessSpec& spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_env && environ) {
    for (char** e = environ; *e; ++e) {
      const std::string entry(*e);
      const auto eq = entry.find('=');
      if (eq == std::string::npos) continue;
      merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

}  // namespace

void append_limited(std::string& dst, const char* src, std::size_t n,
                    std::size_t limit, bool& truncated) {
  if (n == 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min(n, avail);
  dst.append(src, take);
  if (take < n) {
    truncated = true;
  }
}

std::string resolve_executable(const std::string& command) {
  if (command.empty())
    return {};
  if (command.find('/') != std::string::npos) {
    return ::access(command.c_str(), X_OK) == 0 ? command : std::string{};
  }
  const char* path_env = std::getenv("PATH");
  const std::string path = (path_env && path_env[0]) ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path.size()) {
    const size_t colon = path.find(':', start);
    const std::string dir = path.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
    const std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + command;
    struct stat st {};
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    if (colon == std::string::npos)
      break;
    start = colon + 1;
  }
  return {};
}

SpawnedProcess spawn_process(const ProcessSpec& spec) {
  SpawnedProcess proc;

  const std::string executable = resolve_executable(spec.command);
  if (executable.empty()) {
    proc.error_message = "executable not found: " + spec.command;
    return proc;
  }

  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_environment(spec);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int frame_pipe[2] = {-1, -1};
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) ||
      (spec.frame_channel && !make_pipe(frame_pipe))) {
    proc.error_message = std::string("pipe failed: ") + std::strerror(errno);
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(frame_pipe);
    return proc;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    proc.error_message = std::string("fork failed: ") + std::strerror(errno);
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(frame_pipe);
    return proc;
  }

  if (pid == 0) {
    if (spec.new_process_group)
      ::setsid();
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (spec.frame_channel)
      ::dup2(frame_pipe[1], kFrameFd);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }

    if (!spec.cwd.empty()) {
      if (::chdir(spec.cwd.c_str()) != 0)
        ::_exit(127);
    }

    if (spec.max_memory_bytes > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_memory_bytes;
      rl.rlim_max = spec.max_memory_bytes;
      ::setrlimit(RLIMIT_AS, &rl);
    }
    if (spec.max_file_descriptors > 0) {
      struct rlimit rl;
      rl.rlim_cur = spec.max_file_descriptors;
      rl.rlim_max = spec.max_file_descriptors;
      ::setrlimit(RLIMIT_NOFILE, &rl);
    }

    ::execve(executable.c_str(), argv.data(), envp.data());
    ::_exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(frame_pipe[1]);
  proc.pid = pid;
  proc.stdout_fd = out_pipe[0];
  proc.stderr_fd = err_pipe[0];
  proc.frame_fd = frame_pipe[0];
  return proc;
}

void close_process_fds(SpawnedProcess& proc) {
  close_fd(proc.stdout_fd);
  close_fd(proc.stderr_fd);
  close_fd(proc.frame_fd);
}

std::chrono::steady_clock::time_point deadline_after(std::uint64_t timeout_ms) {
  using Clock = std::chrono::steady_clock;
  const auto now = Clock::now();
  const auto headroom =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now).count();
  if (timeout_ms >= static_cast<std::uint64_t>(headroom)) return Clock::time_point::max();
  return now + std::chrono::milliseconds(static_cast<std::int64_t>(timeout_ms));
}

void kill_process_group(pid_t pid) {
  if (pid <= 0)
    return;
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
}

int decode_wait_status(int status, int* term_signal) {
  if (WIFEXITED(status)) {
    if (term_signal)
      *term_signal = 0;
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    if (term_signal)
      *term_signal = WTERMSIG(status);
    return 128 + WTERMSIG(status);
  }
  return -1;
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  SpawnedProcess proc = spawn_process(spec);
  if (!proc.ok()) {
    result.exit_code = 127;
    result.error_message = proc.error_message;
    return result;
  }

  const auto deadline = deadline_after(spec.timeout_ms);
  char buf[4096];
  int status = 0;

  while (proc.stdout_fd >= 0 || proc.stderr_fd >= 0) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      kill_process_group(proc.pid);
      result.timed_out = true;
      break;
    }
    const auto remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

    pollfd fds[2];
    nfds_t n = 0;
    if (proc.stdout_fd >= 0) fds[n++] = pollfd{proc.stdout_fd, POLLIN, 0};
    if (proc.stderr_fd >= 0) fds[n++] = pollfd{proc.stderr_fd, POLLIN, 0};
    const int ready = ::poll(fds, n, static_cast<int>(std::min<long long>(remaining_ms, 100)));
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (nfds_t k = 0; k < n; ++k) {
      if (!(fds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      const ssize_t got = ::read(fds[k].fd, buf, sizeof(buf));
      const bool is_stdout = fds[k].fd == proc.stdout_fd;
      if (got <= 0) {
        close_fd(is_stdout ? proc.stdout_fd : proc.stderr_fd);
        continue;
      }
      if (is_stdout) {
        append_limited(result.stdout_text, buf, static_cast<std::size_t>(got),
                       spec.max_output_bytes, result.stdout_truncated);
      } else {
        append_limited(result.stderr_text, buf, static_cast<std::size_t>(got),
                       spec.max_output_bytes, result.stderr_truncated);
      }
    }
  }

  close_process_fds(proc);
  while (::waitpid(proc.pid, &status, 0) < 0 && errno == EINTR) {
  }
  result.exit_code = result.timed_out ? 124 : decode_wait_status(status, &result.term_signal);
  return result;
}

}  // namespace scratchpad

#endif
