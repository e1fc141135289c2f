#include "Service.h"

namespace hc {

Service::~Service() {
  if (!isStopSet_) {
    stop();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  thread_ = std::thread(&Service::runLoop, this);

  log().debug << "Service started";
  return {};
}

void Service::stop() {
  if (isStopSet_) {
    return;
  }

  log().debug << "Stopping service";

  isStopSet_ = true;
  onStopRequested();

  if (thread_.joinable()) {
    thread_.join();
  }

  onStop();

  log().debug << "Service stopped";
}

} // namespace hc
