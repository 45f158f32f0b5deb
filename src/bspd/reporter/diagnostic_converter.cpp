#include "bspd/reporter/diagnostic_converter.hpp"

#include <string>

#include "bspd/utils/conversion.hpp"

namespace bspd {

auto DiagnosticConverter::ToBspDiagnostic(const Problem& problem)
    -> bsp::Diagnostic {
  return bsp::Diagnostic{
      .range = ToBspRange(problem.position),
      .severity = ToBspSeverity(problem.severity),
      .code = problem.diagnostic_code,
      .source = std::string(kDiagnosticSource),
      .message = problem.message,
  };
}

auto DiagnosticConverter::ToBspSeverity(ProblemSeverity severity)
    -> bsp::DiagnosticSeverity {
  switch (severity) {
    case ProblemSeverity::kInfo:
      return bsp::DiagnosticSeverity::kInformation;
    case ProblemSeverity::kWarning:
      return bsp::DiagnosticSeverity::kWarning;
    case ProblemSeverity::kError:
      return bsp::DiagnosticSeverity::kError;
  }
}

}  // namespace bspd
