#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace portico::internal {

// Counts the run() calls in progress so that shutdown() callers can wait until serving has fully stopped.
class RunTracker {
 public:
  void notifyRunStarted() {
    std::scoped_lock lock(_mutex);
    ++_running;
  }

  void notifyRunFinished() {
    std::scoped_lock lock(_mutex);
    if (_running > 0) {
      --_running;
    }
    _cv.notify_all();
  }

  [[nodiscard]] bool anyRunning() const {
    std::scoped_lock lock(_mutex);
    return _running > 0;
  }

  void waitUntilAllFinished() {
    std::unique_lock lock(_mutex);
    _cv.wait(lock, [this] { return _running == 0; });
  }

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::size_t _running{0};
};

class RunTrackerGuard {
 public:
  explicit RunTrackerGuard(RunTracker& tracker) : _tracker(tracker) { _tracker.notifyRunStarted(); }

  RunTrackerGuard(const RunTrackerGuard&) = delete;
  RunTrackerGuard(RunTrackerGuard&&) = delete;
  RunTrackerGuard& operator=(const RunTrackerGuard&) = delete;
  RunTrackerGuard& operator=(RunTrackerGuard&&) = delete;

  ~RunTrackerGuard() { _tracker.notifyRunFinished(); }

 private:
  RunTracker& _tracker;
};

}  // namespace portico::internal
