#pragma once

#include "bsp/diagnostic.hpp"
#include "bsp/task.hpp"

namespace bsp {

// Server-to-client notifications a build server sends while running tasks.
// Calls are synchronous from the caller's point of view and may arrive from
// any thread; implementations must not block on delivery.
class BuildClient {
 public:
  BuildClient() = default;
  BuildClient(const BuildClient&) = delete;
  BuildClient(BuildClient&&) = delete;
  auto operator=(const BuildClient&) -> BuildClient& = delete;
  auto operator=(BuildClient&&) -> BuildClient& = delete;
  virtual ~BuildClient() = default;

  // build/publishDiagnostics
  virtual auto OnBuildPublishDiagnostics(PublishDiagnosticsParams params)
      -> void = 0;

  // build/taskStart
  virtual auto OnBuildTaskStart(TaskStartParams params) -> void = 0;

  // build/taskFinish
  virtual auto OnBuildTaskFinish(TaskFinishParams params) -> void = 0;
};

}  // namespace bsp
