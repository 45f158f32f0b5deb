#pragma once

#include <atomic>

namespace bspd {

// Start and finish guards for one task. Each Try* call atomically moves its
// flag from pending to fired and returns true only for the single caller that
// made the transition; every later or concurrent call returns false.
class TaskLifecycle {
 public:
  [[nodiscard]] auto TryStart() -> bool {
    return Fire(started_);
  }

  [[nodiscard]] auto TryFinish() -> bool {
    return Fire(finished_);
  }

  [[nodiscard]] auto IsStarted() const -> bool {
    return started_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto IsFinished() const -> bool {
    return finished_.load(std::memory_order_acquire);
  }

 private:
  static auto Fire(std::atomic<bool>& flag) -> bool {
    bool expected = false;
    return flag.compare_exchange_strong(
        expected, true, std::memory_order_acq_rel, std::memory_order_acquire);
  }

  std::atomic<bool> started_{false};
  std::atomic<bool> finished_{false};
};

}  // namespace bspd
