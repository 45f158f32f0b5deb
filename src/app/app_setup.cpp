#include "app/app_setup.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "debug";
constexpr std::string_view kLogPattern = "[%n][%L] %v";

constexpr std::string_view kPipePrefix = "--pipe=";
constexpr std::string_view kConfigPrefix = "--config=";
constexpr std::string_view kEventsPrefix = "--events=";

struct LoggerConfig {
  std::string_view name;
  spdlog::level::level_enum level;
};

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::debug;
}

auto ResolveLogLevel(const std::optional<std::string>& config_level)
    -> spdlog::level::level_enum {
  if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
    return ParseLogLevel(env_level);
  }
  if (config_level.has_value()) {
    return ParseLogLevel(*config_level);
  }
  return ParseLogLevel(kDefaultLogLevel);
}

void ConfigureLogger(
    const std::shared_ptr<spdlog::logger>& logger,
    spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::debug);
}

}  // namespace

auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::optional<CommandLineOptions> {
  CommandLineOptions options;

  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (arg.starts_with(kPipePrefix)) {
      options.pipe_name = arg.substr(kPipePrefix.length());
    } else if (arg.starts_with(kConfigPrefix)) {
      options.config_path = arg.substr(kConfigPrefix.length());
    } else if (arg.starts_with(kEventsPrefix)) {
      options.events_path = std::string(arg.substr(kEventsPrefix.length()));
    } else {
      return std::nullopt;
    }
  }

  if (options.pipe_name.empty() || options.config_path.empty()) {
    return std::nullopt;
  }
  return options;
}

auto SetupLoggers(const std::optional<std::string>& config_level)
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = ResolveLogLevel(config_level);
  spdlog::set_level(user_log_level);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .level = spdlog::level::info},
      LoggerConfig{.name = "jsonrpc", .level = spdlog::level::info},
      LoggerConfig{.name = "bspd", .level = spdlog::level::trace},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    auto logger = spdlog::stdout_color_mt(std::string(config.name));
    const auto level = (config.name == "bspd") ? user_log_level : config.level;
    ConfigureLogger(logger, level);
    loggers[std::string(config.name)] = std::move(logger);
  }

  return loggers;
}

}  // namespace app
