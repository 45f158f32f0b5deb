#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bsp {

// URI
using Uri = std::string;
using DocumentUri = std::string;

// Build Target Identifier
struct BuildTargetIdentifier {
  Uri uri;

  friend auto operator==(
      const BuildTargetIdentifier& lhs, const BuildTargetIdentifier& rhs)
      -> bool = default;
};

void to_json(nlohmann::json& j, const BuildTargetIdentifier& b);
void from_json(const nlohmann::json& j, BuildTargetIdentifier& b);

// Text Document Identifier
struct TextDocumentIdentifier {
  DocumentUri uri;

  friend auto operator==(
      const TextDocumentIdentifier& lhs, const TextDocumentIdentifier& rhs)
      -> bool = default;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

// Position (0-based)
struct Position {
  int line;
  int character;

  friend auto operator==(const Position& lhs, const Position& rhs)
      -> bool = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

// Range
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range& lhs, const Range& rhs) -> bool = default;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Diagnostic
enum class DiagnosticSeverity {
  kError = 1,
  kWarning = 2,
  kInformation = 3,
  kHint = 4,
};

void to_json(nlohmann::json& j, const DiagnosticSeverity& d);
void from_json(const nlohmann::json& j, DiagnosticSeverity& d);

struct Diagnostic {
  Range range;
  std::optional<DiagnosticSeverity> severity;
  std::optional<std::string> code;
  std::optional<std::string> source;
  std::string message;

  friend auto operator==(const Diagnostic& lhs, const Diagnostic& rhs)
      -> bool = default;
};

void to_json(nlohmann::json& j, const Diagnostic& d);
void from_json(const nlohmann::json& j, Diagnostic& d);

// Task Id
struct TaskId {
  std::string id;
  std::optional<std::vector<std::string>> parents;
};

void to_json(nlohmann::json& j, const TaskId& t);
void from_json(const nlohmann::json& j, TaskId& t);

// Status Code
enum class StatusCode {
  kOk = 1,
  kError = 2,
  kCancelled = 3,
};

void to_json(nlohmann::json& j, const StatusCode& s);
void from_json(const nlohmann::json& j, StatusCode& s);

}  // namespace bsp

template <>
struct std::hash<bsp::TextDocumentIdentifier> {
  auto operator()(const bsp::TextDocumentIdentifier& doc) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(doc.uri);
  }
};
