#include "AutoCommit.h"

namespace hc {

AutoCommit::AutoCommit(uint64_t timeoutMs, CommitFunction commit)
    : Service("autocommit"), timeoutMs_(timeoutMs), commit_(std::move(commit)) {}

AutoCommit::~AutoCommit() { stop(); }

void AutoCommit::touch() {
  std::lock_guard<std::mutex> lock(mutex_);
  armed_ = true;
  deadline_ = Clock::now() + std::chrono::milliseconds(timeoutMs_);
  cv_.notify_all();
}

bool AutoCommit::isArmed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return armed_;
}

uint64_t AutoCommit::getFireCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fireCount_;
}

void AutoCommit::onStopRequested() {
  std::lock_guard<std::mutex> lock(mutex_);
  cv_.notify_all();
}

void AutoCommit::runLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!isStopSet()) {
    if (!armed_) {
      cv_.wait(lock);
      continue;
    }

    Clock::time_point deadline = deadline_;
    if (cv_.wait_until(lock, deadline) == std::cv_status::no_timeout) {
      // touched, stopped or spurious; re-evaluate
      continue;
    }
    if (isStopSet() || !armed_ || Clock::now() < deadline_) {
      continue;
    }

    armed_ = false;
    lock.unlock();
    bool started = commit_ ? commit_() : true;
    lock.lock();

    if (started) {
      ++fireCount_;
    } else if (!armed_) {
      log().debug << "Commit in flight, re-arming";
      armed_ = true;
      deadline_ = Clock::now() + std::chrono::milliseconds(timeoutMs_);
    }
  }
}

} // namespace hc
