#include "bspd/compiler/compiler_event_reader.hpp"

#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace bspd {

namespace {

auto IsBlank(std::string_view line) -> bool {
  return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

auto ToEvent(const nlohmann::json& j, std::size_t line_number)
    -> std::expected<CompilerEvent, BspdError> {
  if (!j.is_object() || !j.contains("event") || !j.at("event").is_string()) {
    return BspdError::Unexpected(
        BspdErrorCode::kInvalidEvent,
        fmt::format("line {}: missing \"event\" field", line_number));
  }

  const auto& kind = j.at("event").get_ref<const std::string&>();
  if (kind == "start") {
    return StartEvent{};
  }
  if (kind == "finish") {
    return FinishEvent{};
  }
  if (kind == "summary") {
    return SummaryEvent{};
  }
  if (kind == "problem") {
    if (!j.contains("problem")) {
      return BspdError::Unexpected(
          BspdErrorCode::kInvalidEvent,
          fmt::format("line {}: problem event without payload", line_number));
    }
    return ProblemEvent{.problem = j.at("problem").get<Problem>()};
  }
  if (kind == "fileVisited") {
    if (!j.contains("file") || !j.at("file").is_string()) {
      return BspdError::Unexpected(
          BspdErrorCode::kInvalidEvent,
          fmt::format("line {}: fileVisited event without file", line_number));
    }
    const auto& file = j.at("file").get_ref<const std::string&>();
    if (file.starts_with("file://")) {
      return FileVisitedEvent{.file = CanonicalPath::FromUri(file)};
    }
    return FileVisitedEvent{.file = CanonicalPath(file)};
  }

  return BspdError::Unexpected(
      BspdErrorCode::kUnknownEvent,
      fmt::format("line {}: '{}'", line_number, kind));
}

}  // namespace

CompilerEventReader::CompilerEventReader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto CompilerEventReader::ParseLine(
    std::string_view line, std::size_t line_number) const
    -> std::expected<std::optional<CompilerEvent>, BspdError> {
  if (IsBlank(line)) {
    return std::nullopt;
  }

  try {
    auto json = nlohmann::json::parse(line);
    auto event = ToEvent(json, line_number);
    if (!event) {
      return std::unexpected(event.error());
    }
    return std::optional<CompilerEvent>(std::move(*event));
  } catch (const nlohmann::json::exception& e) {
    return BspdError::Unexpected(
        BspdErrorCode::kInvalidEvent,
        fmt::format("line {}: {}", line_number, e.what()));
  } catch (const std::runtime_error& e) {
    return BspdError::Unexpected(
        BspdErrorCode::kInvalidEvent,
        fmt::format("line {}: {}", line_number, e.what()));
  }
}

auto CompilerEventReader::ReadAll(std::istream& input) const
    -> std::expected<std::vector<CompilerEvent>, BspdError> {
  std::vector<CompilerEvent> events;
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(input, line)) {
    ++line_number;
    auto parsed = ParseLine(line, line_number);
    if (!parsed) {
      logger_->error("CompilerEventReader: {}", parsed.error().Message());
      return std::unexpected(parsed.error());
    }
    if (parsed->has_value()) {
      events.push_back(std::move(**parsed));
    }
  }

  logger_->debug(
      "CompilerEventReader read {} events from {} lines", events.size(),
      line_number);
  return events;
}

auto CompilerEventReader::Dispatch(
    const CompilerEvent& event, CompileProblemReporter& reporter) -> void {
  if (std::holds_alternative<StartEvent>(event)) {
    reporter.Start();
  } else if (const auto* problem = std::get_if<ProblemEvent>(&event)) {
    reporter.Log(problem->problem);
  } else if (const auto* visited = std::get_if<FileVisitedEvent>(&event)) {
    reporter.FileVisited(visited->file);
  } else if (std::holds_alternative<FinishEvent>(event)) {
    reporter.Finish();
  } else if (std::holds_alternative<SummaryEvent>(event)) {
    reporter.PrintSummary();
  }
}

}  // namespace bspd
