#pragma once

#include <atomic>

#include "bspd/compiler/problem.hpp"

namespace bspd {

// Per-severity problem counts. Each counter is read independently, so a
// read taken while problems are still being logged is not a consistent
// snapshot across the three.
class ProblemCounters {
 public:
  auto Increment(ProblemSeverity severity) -> void {
    switch (severity) {
      case ProblemSeverity::kInfo:
        infos_.fetch_add(1, std::memory_order_relaxed);
        return;
      case ProblemSeverity::kWarning:
        warnings_.fetch_add(1, std::memory_order_relaxed);
        return;
      case ProblemSeverity::kError:
        errors_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
  }

  [[nodiscard]] auto Errors() const -> int {
    return errors_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto Warnings() const -> int {
    return warnings_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto Infos() const -> int {
    return infos_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<int> errors_{0};
  std::atomic<int> warnings_{0};
  std::atomic<int> infos_{0};
};

}  // namespace bspd
