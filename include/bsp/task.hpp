#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bsp/basic.hpp"

namespace bsp {

// Task Data Kind
namespace task_data_kind {
inline constexpr std::string_view kCompileTask = "compile-task";
inline constexpr std::string_view kCompileReport = "compile-report";
}  // namespace task_data_kind

// Compile Task
struct CompileTask {
  BuildTargetIdentifier target;
};

void to_json(nlohmann::json& j, const CompileTask& c);
void from_json(const nlohmann::json& j, CompileTask& c);

// Compile Report
struct CompileReport {
  BuildTargetIdentifier target;
  std::optional<std::string> originId;
  int errors;
  int warnings;
  // Compilation time in milliseconds
  std::optional<std::int64_t> time;
};

void to_json(nlohmann::json& j, const CompileReport& c);
void from_json(const nlohmann::json& j, CompileReport& c);

// TaskStart Notification
struct TaskStartParams {
  TaskId taskId;
  std::optional<std::string> originId;
  std::optional<std::int64_t> eventTime;
  std::optional<std::string> message;
  std::optional<std::string> dataKind;
  std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const TaskStartParams& p);
void from_json(const nlohmann::json& j, TaskStartParams& p);

// TaskFinish Notification
struct TaskFinishParams {
  TaskId taskId;
  std::optional<std::string> originId;
  std::optional<std::int64_t> eventTime;
  std::optional<std::string> message;
  StatusCode status;
  std::optional<std::string> dataKind;
  std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const TaskFinishParams& p);
void from_json(const nlohmann::json& j, TaskFinishParams& p);

}  // namespace bsp
