#pragma once

#include "Service.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace hc {

/**
 * AutoCommit - debounce timer firing a commit after a quiet period
 *
 * Every touch() moves the deadline to now + timeout; only the latest deadline
 * fires. The commit function runs in the timer thread without the timer lock
 * held. It returns false when a commit is already in flight, in which case
 * the timer re-arms instead of starting a second commit.
 */
class AutoCommit : public Service {
public:
  using CommitFunction = std::function<bool()>;

  AutoCommit(uint64_t timeoutMs, CommitFunction commit);
  ~AutoCommit() override;

  /**
   * (Re)arm the deadline
   */
  void touch();

  bool isArmed() const;
  uint64_t getTimeoutMs() const { return timeoutMs_; }

  /**
   * Number of commits started by the timer
   */
  uint64_t getFireCount() const;

protected:
  void runLoop() override;
  void onStopRequested() override;

private:
  using Clock = std::chrono::steady_clock;

  uint64_t timeoutMs_{ 0 };
  CommitFunction commit_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool armed_{ false };
  Clock::time_point deadline_;
  uint64_t fireCount_{ 0 };
};

} // namespace hc
