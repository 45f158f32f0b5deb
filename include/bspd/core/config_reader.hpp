#pragma once

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "bspd/core/bspd_config_file.hpp"
#include "bspd/utils/canonical_path.hpp"

namespace bspd {

// Stateless utility that locates and reads .bspd configuration files
class ConfigReader {
 public:
  explicit ConfigReader(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load a configuration from the given file, or from the .bspd file inside
  // it when the path is a directory
  [[nodiscard]] auto Load(const CanonicalPath& path) const
      -> std::optional<BspdConfigFile>;

  // Load configuration from workspace root (looks for .bspd file)
  [[nodiscard]] auto LoadFromWorkspace(const CanonicalPath& workspace_root)
      const -> std::optional<BspdConfigFile>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bspd
