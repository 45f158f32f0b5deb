#pragma once

#include "bspd/compiler/problem.hpp"
#include "bspd/utils/canonical_path.hpp"

namespace bspd {

// Problem-reporting contract the compiler drives during one compilation.
// Any method may be invoked concurrently from compiler worker threads.
class CompileProblemReporter {
 public:
  CompileProblemReporter() = default;
  CompileProblemReporter(const CompileProblemReporter&) = delete;
  CompileProblemReporter(CompileProblemReporter&&) = delete;
  auto operator=(const CompileProblemReporter&)
      -> CompileProblemReporter& = delete;
  auto operator=(CompileProblemReporter&&) -> CompileProblemReporter& = delete;
  virtual ~CompileProblemReporter() = default;

  virtual auto LogError(const Problem& problem) -> void = 0;
  virtual auto LogWarning(const Problem& problem) -> void = 0;
  virtual auto LogInfo(const Problem& problem) -> void = 0;

  // Called for every compiled file, including files without problems
  virtual auto FileVisited(const CanonicalPath& file) -> void = 0;

  virtual auto PrintSummary() -> void = 0;

  virtual auto Start() -> void = 0;
  virtual auto Finish() -> void = 0;

  // Routes a problem to the entry point matching its severity
  auto Log(const Problem& problem) -> void {
    switch (problem.severity) {
      case ProblemSeverity::kInfo:
        LogInfo(problem);
        return;
      case ProblemSeverity::kWarning:
        LogWarning(problem);
        return;
      case ProblemSeverity::kError:
        LogError(problem);
        return;
    }
  }
};

}  // namespace bspd
