#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

struct CommandLineOptions {
  std::string pipe_name;
  std::string config_path;
  // Compiler event stream; stdin when absent
  std::optional<std::string> events_path;
};

/// Parse --pipe=<name> --config=<path> [--events=<path>]
/// Returns nullopt if a required option is missing or an option is unknown
auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::optional<CommandLineOptions>;

/// Setup structured logging with named loggers
/// Returns configured loggers for transport, jsonrpc, and bspd components.
/// SPDLOG_LEVEL takes precedence over config_level for the bspd logger.
auto SetupLoggers(const std::optional<std::string>& config_level = std::nullopt)
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
