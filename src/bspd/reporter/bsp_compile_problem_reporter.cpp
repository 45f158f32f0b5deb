#include "bspd/reporter/bsp_compile_problem_reporter.hpp"

#include <chrono>

#include <fmt/format.h>

#include "bspd/reporter/diagnostic_converter.hpp"

namespace bspd {

namespace {

auto SteadyNowMillis() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace

BspCompileProblemReporter::BspCompileProblemReporter(
    std::shared_ptr<bsp::BuildClient> client,
    bsp::BuildTargetIdentifier target_id, std::string target_display_name,
    bsp::TaskId task_id, std::optional<std::string> origin_id,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      client_(std::move(client)),
      target_id_(std::move(target_id)),
      target_display_name_(std::move(target_display_name)),
      task_id_(std::move(task_id)),
      origin_id_(std::move(origin_id)),
      compile_task_{.target = target_id_} {
}

auto BspCompileProblemReporter::LogError(const Problem& problem) -> void {
  LogProblem(problem);
  counters_.Increment(ProblemSeverity::kError);
}

auto BspCompileProblemReporter::LogWarning(const Problem& problem) -> void {
  LogProblem(problem);
  counters_.Increment(ProblemSeverity::kWarning);
}

auto BspCompileProblemReporter::LogInfo(const Problem& problem) -> void {
  LogProblem(problem);
  counters_.Increment(ProblemSeverity::kInfo);
}

auto BspCompileProblemReporter::FileVisited(const CanonicalPath& file)
    -> void {
  bsp::TextDocumentIdentifier document{.uri = file.ToUri()};
  auto revision = store_.Revise(document);
  logger_->trace(
      "BspCompileProblemReporter visited {} ({} diagnostics)", document.uri,
      revision.diagnostics->size());
  Publish(document, revision);
}

auto BspCompileProblemReporter::PrintSummary() -> void {
  Finish();
}

auto BspCompileProblemReporter::Start() -> void {
  if (!lifecycle_.TryStart()) {
    return;
  }
  started_at_ms_.store(SteadyNowMillis());

  logger_->debug(
      "BspCompileProblemReporter starting task {} for {}", task_id_.id,
      target_id_.uri);

  client_->OnBuildTaskStart(bsp::TaskStartParams{
      .taskId = task_id_,
      .eventTime = EventTimeNow(),
      .message = fmt::format("Compiling target {}", target_display_name_),
      .dataKind = std::string(bsp::task_data_kind::kCompileTask),
      .data = nlohmann::json(compile_task_),
  });
}

auto BspCompileProblemReporter::Finish() -> void {
  if (!lifecycle_.TryFinish()) {
    return;
  }

  const auto status = GetStatusCode();
  const auto started_at = started_at_ms_.load();

  bsp::CompileReport report{
      .target = target_id_,
      .originId = origin_id_,
      .errors = counters_.Errors(),
      .warnings = counters_.Warnings(),
      .time = started_at >= 0
                  ? std::optional<std::int64_t>(SteadyNowMillis() - started_at)
                  : std::nullopt,
  };

  logger_->debug(
      "BspCompileProblemReporter finished task {} for {}: {} errors, {} "
      "warnings, {} infos",
      task_id_.id, target_id_.uri, report.errors, report.warnings,
      counters_.Infos());

  client_->OnBuildTaskFinish(bsp::TaskFinishParams{
      .taskId = task_id_,
      .eventTime = EventTimeNow(),
      .message = fmt::format("Compiled {}", target_display_name_),
      .status = status,
      .dataKind = std::string(bsp::task_data_kind::kCompileReport),
      .data = nlohmann::json(report),
  });
}

auto BspCompileProblemReporter::LogProblem(const Problem& problem) -> void {
  auto diagnostic = DiagnosticConverter::ToBspDiagnostic(problem);
  auto document = DocumentFor(problem);

  logger_->trace(
      "BspCompileProblemReporter {} at {}:{}:{}: {}", ToString(problem.severity),
      document.uri, diagnostic.range.start.line,
      diagnostic.range.start.character, diagnostic.message);

  auto revision = store_.Append(document, std::move(diagnostic));
  Publish(document, revision);
}

auto BspCompileProblemReporter::DocumentFor(const Problem& problem) const
    -> bsp::TextDocumentIdentifier {
  if (problem.position.source_file.has_value()) {
    return {.uri = problem.position.source_file->ToUri()};
  }
  return {.uri = target_id_.uri};
}

auto BspCompileProblemReporter::Publish(
    const bsp::TextDocumentIdentifier& document,
    const DiagnosticStore::Revision& revision) -> void {
  store_.DeliverInOrder(
      document, revision, [&](const DiagnosticStore::Snapshot& diagnostics) {
        client_->OnBuildPublishDiagnostics(bsp::PublishDiagnosticsParams{
            .textDocument = document,
            .buildTarget = target_id_,
            .originId = origin_id_,
            .diagnostics = *diagnostics,
            .reset = true,
        });
      });
}

auto BspCompileProblemReporter::GetStatusCode() const -> bsp::StatusCode {
  return counters_.Errors() > 0 ? bsp::StatusCode::kError
                                : bsp::StatusCode::kOk;
}

auto BspCompileProblemReporter::EventTimeNow() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace bspd
