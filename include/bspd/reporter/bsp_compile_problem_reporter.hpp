#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "bsp/basic.hpp"
#include "bsp/build_client.hpp"
#include "bsp/task.hpp"
#include "bspd/compiler/compile_problem_reporter.hpp"
#include "bspd/reporter/diagnostic_store.hpp"
#include "bspd/reporter/problem_counters.hpp"
#include "bspd/reporter/task_lifecycle.hpp"

namespace bspd {

// Reporter that turns every logged problem into a build/publishDiagnostics
// notification and brackets the compilation with build/taskStart and
// build/taskFinish (data kinds compile-task and compile-report).
//
// Each publish carries the full list accumulated so far for the document
// with reset=true. Problems without a source file are published against the
// build target's own URI. The origin id, when given, is echoed on every
// publish and on the compile report.
//
// One instance serves exactly one compilation task. All entry points are
// thread-safe, and no internal lock is held while calling into the client.
// Publishes for one document reach the client in the order the store was
// updated; a caller whose update is newer waits for the older publish to be
// handed over first.
class BspCompileProblemReporter : public CompileProblemReporter {
 public:
  BspCompileProblemReporter(
      std::shared_ptr<bsp::BuildClient> client,
      bsp::BuildTargetIdentifier target_id, std::string target_display_name,
      bsp::TaskId task_id, std::optional<std::string> origin_id,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto LogError(const Problem& problem) -> void override;
  auto LogWarning(const Problem& problem) -> void override;
  auto LogInfo(const Problem& problem) -> void override;

  auto FileVisited(const CanonicalPath& file) -> void override;

  auto PrintSummary() -> void override;

  auto Start() -> void override;
  auto Finish() -> void override;

  [[nodiscard]] auto Counters() const -> const ProblemCounters& {
    return counters_;
  }

  [[nodiscard]] auto Diagnostics() const -> const DiagnosticStore& {
    return store_;
  }

  [[nodiscard]] auto Lifecycle() const -> const TaskLifecycle& {
    return lifecycle_;
  }

  [[nodiscard]] auto GetCompileTask() const -> const bsp::CompileTask& {
    return compile_task_;
  }

 private:
  auto LogProblem(const Problem& problem) -> void;

  [[nodiscard]] auto DocumentFor(const Problem& problem) const
      -> bsp::TextDocumentIdentifier;

  auto Publish(
      const bsp::TextDocumentIdentifier& document,
      const DiagnosticStore::Revision& revision) -> void;

  [[nodiscard]] auto GetStatusCode() const -> bsp::StatusCode;

  static auto EventTimeNow() -> std::int64_t;

  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<bsp::BuildClient> client_;

  bsp::BuildTargetIdentifier target_id_;
  std::string target_display_name_;
  bsp::TaskId task_id_;
  std::optional<std::string> origin_id_;
  bsp::CompileTask compile_task_;

  DiagnosticStore store_;
  ProblemCounters counters_;
  TaskLifecycle lifecycle_;

  // Steady-clock milliseconds at Start(), or -1 if the task never started
  std::atomic<std::int64_t> started_at_ms_{-1};
};

}  // namespace bspd
