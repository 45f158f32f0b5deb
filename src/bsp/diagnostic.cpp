#include "bsp/diagnostic.hpp"

#include "bsp/json_utils.hpp"

namespace bsp {

// PublishDiagnostics Notification
void to_json(nlohmann::json& j, const PublishDiagnosticsParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "buildTarget", p.buildTarget);
  to_json_optional(j, "originId", p.originId);
  to_json_required(j, "diagnostics", p.diagnostics);
  to_json_required(j, "reset", p.reset);
}

void from_json(const nlohmann::json& j, PublishDiagnosticsParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "buildTarget", p.buildTarget);
  from_json_optional(j, "originId", p.originId);
  from_json_required(j, "diagnostics", p.diagnostics);
  from_json_required(j, "reset", p.reset);
}

}  // namespace bsp
