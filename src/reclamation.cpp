#include "scratchpad/reclamation.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>

#include "scratchpad/observability.hpp"

namespace scratchpad {

namespace fs = std::filesystem;

ReclamationVerifier::ReclamationVerifier(ReclamationPolicy policy)
    : policy_(policy), worker_([this] { worker_loop(); }) {}

ReclamationVerifier::~ReclamationVerifier() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void ReclamationVerifier::verify(BoundaryWeakRef ref) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(std::move(ref));
  }
  cv_.notify_one();
}

void ReclamationVerifier::set_report_callback(ReportCallback cb) {
  std::lock_guard<std::mutex> lk(mu_);
  callback_ = std::move(cb);
}

void ReclamationVerifier::drain() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this] { return queue_.empty() && !busy_; });
}

std::size_t ReclamationVerifier::watch_list_size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return watch_list_.size();
}

bool ReclamationVerifier::process_gone(std::int64_t pid) {
  if (pid <= 0) return true;
  int status = 0;
  const pid_t w = ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
  // ECHILD: already reaped elsewhere, or not our child.
  return w == static_cast<pid_t>(pid) || (w < 0 && errno == ECHILD);
}

void ReclamationVerifier::reap_watch_list() {
  std::lock_guard<std::mutex> lk(mu_);
  watch_list_.erase(std::remove_if(watch_list_.begin(), watch_list_.end(),
                                   [this](std::int64_t pid) { return process_gone(pid); }),
                    watch_list_.end());
}

ReclamationReport ReclamationVerifier::verify_now(const BoundaryWeakRef& ref) {
  reap_watch_list();

  ReclamationReport report;
  report.boundary_id = ref.boundary_id;
  bool pid_gone = false;
  for (std::uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    report.attempts = attempt;
    if (!pid_gone) pid_gone = process_gone(ref.pid);
    std::error_code ec;
    if (!ref.staging_dir.empty()) fs::remove_all(ref.staging_dir, ec);
    const bool dir_gone = ref.staging_dir.empty() || !fs::exists(ref.staging_dir, ec);
    if (pid_gone && dir_gone) {
      report.state = ReclamationState::collected;
      break;
    }
    if (attempt < policy_.max_attempts) std::this_thread::sleep_for(policy_.poll_interval);
  }

  if (report.state == ReclamationState::still_reachable && !pid_gone && ref.pid > 0) {
    std::lock_guard<std::mutex> lk(mu_);
    watch_list_.push_back(ref.pid);
  }

  emit_reclamation_event(ReclamationEvent{report.boundary_id, report.attempts, report.state});
  return report;
}

void ReclamationVerifier::worker_loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (true) {
    cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
    if (queue_.empty() && stop_) break;
    BoundaryWeakRef ref = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lk.unlock();

    const ReclamationReport report = verify_now(ref);

    lk.lock();
    ReportCallback cb = callback_;
    lk.unlock();
    if (cb) cb(report);
    lk.lock();
    busy_ = false;
    if (queue_.empty()) idle_cv_.notify_all();
  }
  busy_ = false;
  idle_cv_.notify_all();
}

}  // namespace scratchpad
