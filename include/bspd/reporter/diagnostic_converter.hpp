#pragma once

#include <string_view>

#include "bsp/basic.hpp"
#include "bspd/compiler/problem.hpp"

namespace bspd {

// Value of Diagnostic.source on everything this reporter publishes
inline constexpr std::string_view kDiagnosticSource = "bspd";

// Stateless utility for converting compiler problems to BSP diagnostics
class DiagnosticConverter {
 public:
  DiagnosticConverter() = delete;

  static auto ToBspDiagnostic(const Problem& problem) -> bsp::Diagnostic;

  static auto ToBspSeverity(ProblemSeverity severity)
      -> bsp::DiagnosticSeverity;
};

}  // namespace bspd
