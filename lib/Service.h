#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace hc {

/**
 * Service - Base class for components that run a loop in a dedicated thread.
 *
 * Derived classes implement runLoop(), which must check isStopSet()
 * periodically so that stop() can join the thread.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name) : Module(name) {}

  /**
   * Stops the thread if it is still running. Derived classes that own state
   * used by runLoop() must call stop() in their own destructor.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return !isStopSet_; }

  Roe<void> start();
  void stop();

protected:
  virtual void runLoop() = 0;

  /**
   * Called in the caller's thread before the service thread starts.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called in the caller's thread after the service thread has joined.
   */
  virtual void onStop() {}

  /**
   * Called by stop() after the stop flag is set, before joining. Derived
   * classes blocking on a condition variable wake their thread here.
   */
  virtual void onStopRequested() {}

private:
  std::atomic<bool> isStopSet_{ true };
  std::thread thread_;
};

} // namespace hc
