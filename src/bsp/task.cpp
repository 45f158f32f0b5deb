#include "bsp/task.hpp"

#include "bsp/json_utils.hpp"

namespace bsp {

// Compile Task
void to_json(nlohmann::json& j, const CompileTask& c) {
  to_json_required(j, "target", c.target);
}

void from_json(const nlohmann::json& j, CompileTask& c) {
  from_json_required(j, "target", c.target);
}

// Compile Report
void to_json(nlohmann::json& j, const CompileReport& c) {
  to_json_required(j, "target", c.target);
  to_json_optional(j, "originId", c.originId);
  to_json_required(j, "errors", c.errors);
  to_json_required(j, "warnings", c.warnings);
  to_json_optional(j, "time", c.time);
}

void from_json(const nlohmann::json& j, CompileReport& c) {
  from_json_required(j, "target", c.target);
  from_json_optional(j, "originId", c.originId);
  from_json_required(j, "errors", c.errors);
  from_json_required(j, "warnings", c.warnings);
  from_json_optional(j, "time", c.time);
}

// TaskStart Notification
void to_json(nlohmann::json& j, const TaskStartParams& p) {
  to_json_required(j, "taskId", p.taskId);
  to_json_optional(j, "originId", p.originId);
  to_json_optional(j, "eventTime", p.eventTime);
  to_json_optional(j, "message", p.message);
  to_json_optional(j, "dataKind", p.dataKind);
  to_json_optional(j, "data", p.data);
}

void from_json(const nlohmann::json& j, TaskStartParams& p) {
  from_json_required(j, "taskId", p.taskId);
  from_json_optional(j, "originId", p.originId);
  from_json_optional(j, "eventTime", p.eventTime);
  from_json_optional(j, "message", p.message);
  from_json_optional(j, "dataKind", p.dataKind);
  from_json_optional(j, "data", p.data);
}

// TaskFinish Notification
void to_json(nlohmann::json& j, const TaskFinishParams& p) {
  to_json_required(j, "taskId", p.taskId);
  to_json_optional(j, "originId", p.originId);
  to_json_optional(j, "eventTime", p.eventTime);
  to_json_optional(j, "message", p.message);
  to_json_required(j, "status", p.status);
  to_json_optional(j, "dataKind", p.dataKind);
  to_json_optional(j, "data", p.data);
}

void from_json(const nlohmann::json& j, TaskFinishParams& p) {
  from_json_required(j, "taskId", p.taskId);
  from_json_optional(j, "originId", p.originId);
  from_json_optional(j, "eventTime", p.eventTime);
  from_json_optional(j, "message", p.message);
  from_json_required(j, "status", p.status);
  from_json_optional(j, "dataKind", p.dataKind);
  from_json_optional(j, "data", p.data);
}

}  // namespace bsp
