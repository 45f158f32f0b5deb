#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bspd/utils/canonical_path.hpp"

namespace bspd {

enum class ProblemSeverity {
  kInfo,
  kWarning,
  kError,
};

// Source position as reported by the compiler. Line numbers are 1-based,
// columns and the pointer offset are 0-based. Every field is optional; a
// problem without a source file refers to the build target as a whole.
struct ProblemPosition {
  std::optional<CanonicalPath> source_file;
  std::optional<int> line;
  std::optional<int> start_line;
  std::optional<int> start_column;
  std::optional<int> end_line;
  std::optional<int> end_column;
  std::optional<int> pointer;
};

struct Problem {
  ProblemSeverity severity;
  std::string message;
  ProblemPosition position;
  std::optional<std::string> diagnostic_code;
};

[[nodiscard]] auto ToString(ProblemSeverity severity) -> std::string_view;

// Wire form used by compiler wrappers (camelCase keys, lowercase severity)
void to_json(nlohmann::json& j, const ProblemSeverity& s);
void from_json(const nlohmann::json& j, ProblemSeverity& s);
void to_json(nlohmann::json& j, const ProblemPosition& p);
void from_json(const nlohmann::json& j, ProblemPosition& p);
void to_json(nlohmann::json& j, const Problem& p);
void from_json(const nlohmann::json& j, Problem& p);

}  // namespace bspd
