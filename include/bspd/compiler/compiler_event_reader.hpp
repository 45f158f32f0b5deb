#pragma once

#include <cstddef>
#include <expected>
#include <istream>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "bspd/compiler/compile_problem_reporter.hpp"
#include "bspd/compiler/problem.hpp"
#include "bspd/error/error.hpp"
#include "bspd/utils/canonical_path.hpp"

namespace bspd {

// Events a compiler wrapper emits, one JSON object per line:
//   {"event":"start"}
//   {"event":"problem","problem":{...}}
//   {"event":"fileVisited","file":"/abs/path.scala"}
//   {"event":"finish"} or {"event":"summary"}
struct StartEvent {};

struct ProblemEvent {
  Problem problem;
};

struct FileVisitedEvent {
  CanonicalPath file;
};

struct FinishEvent {};

struct SummaryEvent {};

using CompilerEvent = std::variant<
    StartEvent, ProblemEvent, FileVisitedEvent, FinishEvent, SummaryEvent>;

class CompilerEventReader {
 public:
  explicit CompilerEventReader(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Parses one line. Blank lines yield std::nullopt. line_number is 1-based
  // and only used in error messages.
  [[nodiscard]] auto ParseLine(std::string_view line, std::size_t line_number)
      const -> std::expected<std::optional<CompilerEvent>, BspdError>;

  // Reads the whole stream, failing on the first malformed line
  [[nodiscard]] auto ReadAll(std::istream& input) const
      -> std::expected<std::vector<CompilerEvent>, BspdError>;

  // Forwards one event to the matching reporter entry point
  static auto Dispatch(
      const CompilerEvent& event, CompileProblemReporter& reporter) -> void;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bspd
