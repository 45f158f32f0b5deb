#include "bspd/core/bspd_config_file.hpp"

#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "bspd/utils/path_utils.hpp"

namespace bspd {

namespace {

auto ParseConfig(
    const YAML::Node& yaml, BspdConfigFile::Target& target,
    BspdConfigFile::Task& task, std::optional<std::string>& log_level,
    spdlog::logger& logger) -> bool {
  // Parse Target section
  if (!yaml["Target"] || !yaml["Target"]["Uri"]) {
    logger.error(".bspd configuration has no Target.Uri");
    return false;
  }
  target.id.uri = yaml["Target"]["Uri"].as<std::string>();
  if (yaml["Target"]["DisplayName"]) {
    target.display_name = yaml["Target"]["DisplayName"].as<std::string>();
  } else {
    target.display_name = LastSegment(target.id.uri);
  }

  // Parse Task section
  task.id = target.display_name + "-compile";
  if (yaml["Task"]) {
    if (yaml["Task"]["Id"]) {
      task.id = yaml["Task"]["Id"].as<std::string>();
    }
    if (yaml["Task"]["OriginId"]) {
      task.origin_id = yaml["Task"]["OriginId"].as<std::string>();
    }
  }

  // Parse Logging section
  if (yaml["Logging"] && yaml["Logging"]["Level"]) {
    log_level = yaml["Logging"]["Level"].as<std::string>();
  }

  logger.debug(
      "Loaded target {} ({}), task {}", target.id.uri, target.display_name,
      task.id);
  return true;
}

}  // namespace

BspdConfigFile::BspdConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto BspdConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<BspdConfigFile> {
  BspdConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug(
        "No .bspd configuration file found at {}", config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());
    if (!ParseConfig(
            yaml, config.target_, config.task_, config.log_level_,
            *config.logger_)) {
      return std::nullopt;
    }
    config.logger_->debug("Loaded .bspd configuration from {}", config_path);
    return config;
  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .bspd configuration file: {}", e.what());
    return std::nullopt;
  }
}

auto BspdConfigFile::LoadFromString(
    const std::string& content, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<BspdConfigFile> {
  BspdConfigFile config(logger);

  try {
    YAML::Node yaml = YAML::Load(content);
    if (!ParseConfig(
            yaml, config.target_, config.task_, config.log_level_,
            *config.logger_)) {
      return std::nullopt;
    }
    return config;
  } catch (const YAML::Exception& e) {
    config.logger_->error("Error parsing .bspd configuration: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace bspd
