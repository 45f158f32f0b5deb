#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "bsp/basic.hpp"
#include "bspd/utils/canonical_path.hpp"

namespace bspd {

// Represents the contents of a .bspd configuration file:
//
//   Target:
//     Uri: file:///work/app
//     DisplayName: app
//   Task:
//     Id: app-compile
//     OriginId: req-42
//   Logging:
//     Level: info
class BspdConfigFile {
 public:
  struct Target {
    bsp::BuildTargetIdentifier id;
    std::string display_name;
  };

  struct Task {
    std::string id;
    std::optional<std::string> origin_id;
  };

  explicit BspdConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load a configuration from a YAML file.
  // Returns std::nullopt if the file doesn't exist, cannot be parsed, or has
  // no Target.Uri.
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<BspdConfigFile>;

  // Same as LoadFromFile, from YAML text
  static auto LoadFromString(
      const std::string& content,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<BspdConfigFile>;

  [[nodiscard]] auto GetTarget() const -> const Target& {
    return target_;
  }

  [[nodiscard]] auto GetTask() const -> const Task& {
    return task_;
  }

  [[nodiscard]] auto GetLogLevel() const -> const std::optional<std::string>& {
    return log_level_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;

  Target target_;
  Task task_;

  // Raw level name; validated by the logger setup
  std::optional<std::string> log_level_;
};

}  // namespace bspd
