#include "bsp/basic.hpp"

#include <stdexcept>

#include "bsp/json_utils.hpp"

namespace bsp {

// Build Target Identifier
void to_json(nlohmann::json& j, const BuildTargetIdentifier& b) {
  to_json_required(j, "uri", b.uri);
}

void from_json(const nlohmann::json& j, BuildTargetIdentifier& b) {
  from_json_required(j, "uri", b.uri);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  to_json_required(j, "uri", t.uri);
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  from_json_required(j, "uri", t.uri);
}

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Diagnostic
void to_json(nlohmann::json& j, const DiagnosticSeverity& d) {
  j = static_cast<int>(d);
}

void from_json(const nlohmann::json& j, DiagnosticSeverity& d) {
  auto value = j.get<int>();
  if (value < static_cast<int>(DiagnosticSeverity::kError) ||
      value > static_cast<int>(DiagnosticSeverity::kHint)) {
    throw std::runtime_error("Invalid diagnostic severity");
  }
  d = static_cast<DiagnosticSeverity>(value);
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
  to_json_required(j, "range", d.range);
  to_json_optional(j, "severity", d.severity);
  to_json_optional(j, "code", d.code);
  to_json_optional(j, "source", d.source);
  to_json_required(j, "message", d.message);
}

void from_json(const nlohmann::json& j, Diagnostic& d) {
  from_json_required(j, "range", d.range);
  from_json_optional(j, "severity", d.severity);
  from_json_optional(j, "code", d.code);
  from_json_optional(j, "source", d.source);
  from_json_required(j, "message", d.message);
}

// Task Id
void to_json(nlohmann::json& j, const TaskId& t) {
  to_json_required(j, "id", t.id);
  to_json_optional(j, "parents", t.parents);
}

void from_json(const nlohmann::json& j, TaskId& t) {
  from_json_required(j, "id", t.id);
  from_json_optional(j, "parents", t.parents);
}

// Status Code
void to_json(nlohmann::json& j, const StatusCode& s) {
  j = static_cast<int>(s);
}

void from_json(const nlohmann::json& j, StatusCode& s) {
  switch (j.get<int>()) {
    case 1:
      s = StatusCode::kOk;
      break;
    case 2:
      s = StatusCode::kError;
      break;
    case 3:
      s = StatusCode::kCancelled;
      break;
    default:
      throw std::runtime_error("Invalid status code");
  }
}

}  // namespace bsp
