#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bsp/basic.hpp"

namespace bsp {

// PublishDiagnostics Notification
//
// With reset set, the diagnostics list replaces everything the client holds
// for the document in the given build target.
struct PublishDiagnosticsParams {
  TextDocumentIdentifier textDocument;
  BuildTargetIdentifier buildTarget;
  std::optional<std::string> originId;
  std::vector<Diagnostic> diagnostics;
  bool reset;
};

void to_json(nlohmann::json& j, const PublishDiagnosticsParams& p);
void from_json(const nlohmann::json& j, PublishDiagnosticsParams& p);

}  // namespace bsp
