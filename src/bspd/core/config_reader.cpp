#include "bspd/core/config_reader.hpp"

#include <filesystem>
#include <system_error>

namespace bspd {

namespace {

constexpr std::string_view kConfigFileName = ".bspd";

}  // namespace

ConfigReader::ConfigReader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto ConfigReader::Load(const CanonicalPath& path) const
    -> std::optional<BspdConfigFile> {
  std::error_code ec;
  if (std::filesystem::is_directory(path.Path(), ec)) {
    return LoadFromWorkspace(path);
  }
  logger_->debug("ConfigReader loading config from: {}", path);
  return BspdConfigFile::LoadFromFile(path, logger_);
}

auto ConfigReader::LoadFromWorkspace(const CanonicalPath& workspace_root) const
    -> std::optional<BspdConfigFile> {
  logger_->debug(
      "ConfigReader loading config from workspace: {}", workspace_root);
  return BspdConfigFile::LoadFromFile(
      workspace_root / kConfigFileName, logger_);
}

}  // namespace bspd
