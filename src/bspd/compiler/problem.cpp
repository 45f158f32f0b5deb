#include "bspd/compiler/problem.hpp"

#include <stdexcept>

#include "bsp/json_utils.hpp"

namespace bspd {

using bsp::from_json_optional;
using bsp::from_json_required;
using bsp::to_json_optional;
using bsp::to_json_required;

namespace {

constexpr std::string_view kFileScheme = "file://";

auto SourceFileFromString(const std::string& value) -> CanonicalPath {
  if (value.starts_with(kFileScheme)) {
    return CanonicalPath::FromUri(value);
  }
  return CanonicalPath(value);
}

}  // namespace

auto ToString(ProblemSeverity severity) -> std::string_view {
  switch (severity) {
    case ProblemSeverity::kInfo:
      return "info";
    case ProblemSeverity::kWarning:
      return "warning";
    case ProblemSeverity::kError:
      return "error";
  }
  return "unknown";
}

void to_json(nlohmann::json& j, const ProblemSeverity& s) {
  j = std::string(ToString(s));
}

void from_json(const nlohmann::json& j, ProblemSeverity& s) {
  const auto& value = j.get_ref<const std::string&>();
  if (value == "info") {
    s = ProblemSeverity::kInfo;
  } else if (value == "warning" || value == "warn") {
    s = ProblemSeverity::kWarning;
  } else if (value == "error") {
    s = ProblemSeverity::kError;
  } else {
    throw std::runtime_error("Invalid problem severity: " + value);
  }
}

void to_json(nlohmann::json& j, const ProblemPosition& p) {
  j = nlohmann::json::object();
  if (p.source_file.has_value()) {
    j["sourceFile"] = p.source_file->String();
  }
  to_json_optional(j, "line", p.line);
  to_json_optional(j, "startLine", p.start_line);
  to_json_optional(j, "startColumn", p.start_column);
  to_json_optional(j, "endLine", p.end_line);
  to_json_optional(j, "endColumn", p.end_column);
  to_json_optional(j, "pointer", p.pointer);
}

void from_json(const nlohmann::json& j, ProblemPosition& p) {
  std::optional<std::string> source_file;
  from_json_optional(j, "sourceFile", source_file);
  // An empty string is the same as no source file
  if (source_file.has_value() && !source_file->empty()) {
    p.source_file = SourceFileFromString(*source_file);
  } else {
    p.source_file = std::nullopt;
  }
  from_json_optional(j, "line", p.line);
  from_json_optional(j, "startLine", p.start_line);
  from_json_optional(j, "startColumn", p.start_column);
  from_json_optional(j, "endLine", p.end_line);
  from_json_optional(j, "endColumn", p.end_column);
  from_json_optional(j, "pointer", p.pointer);
}

void to_json(nlohmann::json& j, const Problem& p) {
  to_json_required(j, "severity", p.severity);
  to_json_required(j, "message", p.message);
  to_json_required(j, "position", p.position);
  to_json_optional(j, "diagnosticCode", p.diagnostic_code);
}

void from_json(const nlohmann::json& j, Problem& p) {
  from_json_required(j, "severity", p.severity);
  from_json_required(j, "message", p.message);
  if (j.contains("position")) {
    from_json_required(j, "position", p.position);
  } else {
    p.position = ProblemPosition{};
  }
  from_json_optional(j, "diagnosticCode", p.diagnostic_code);
}

}  // namespace bspd
