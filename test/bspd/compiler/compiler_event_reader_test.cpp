#include "bspd/compiler/compiler_event_reader.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <variant>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "bspd/reporter/bsp_compile_problem_reporter.hpp"
#include "test/bspd/common/recording_build_client.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bspd::BspdErrorCode;
using bspd::CompilerEvent;
using bspd::CompilerEventReader;

namespace {

auto ParseOne(std::string_view line) -> CompilerEvent {
  CompilerEventReader reader;
  auto result = reader.ParseLine(line, 1);
  REQUIRE(result.has_value());
  REQUIRE(result->has_value());
  return **result;
}

}  // namespace

TEST_CASE("CompilerEventReader parses lifecycle events", "[event_reader]") {
  REQUIRE(std::holds_alternative<bspd::StartEvent>(
      ParseOne(R"({"event":"start"})")));
  REQUIRE(std::holds_alternative<bspd::FinishEvent>(
      ParseOne(R"({"event":"finish"})")));
  REQUIRE(std::holds_alternative<bspd::SummaryEvent>(
      ParseOne(R"({"event":"summary"})")));
}

TEST_CASE("CompilerEventReader parses problem events", "[event_reader]") {
  SECTION("full position") {
    auto event = ParseOne(
        R"({"event":"problem","problem":{"severity":"error","message":"boom",)"
        R"("diagnosticCode":"E1","position":{"sourceFile":"/src/A.scala",)"
        R"("line":3,"startLine":3,"startColumn":1,"endLine":4,"endColumn":6}}})");
    const auto* problem = std::get_if<bspd::ProblemEvent>(&event);
    REQUIRE(problem != nullptr);
    REQUIRE(problem->problem.severity == bspd::ProblemSeverity::kError);
    REQUIRE(problem->problem.message == "boom");
    REQUIRE(problem->problem.diagnostic_code == "E1");
    const auto& position = problem->problem.position;
    REQUIRE(position.source_file.has_value());
    REQUIRE(position.source_file->ToUri() == "file:///src/A.scala");
    REQUIRE(position.line == 3);
    REQUIRE(position.start_column == 1);
    REQUIRE(position.end_line == 4);
    REQUIRE(position.end_column == 6);
    REQUIRE_FALSE(position.pointer.has_value());
  }

  SECTION("no position refers to the target") {
    auto event = ParseOne(
        R"({"event":"problem","problem":{"severity":"warn","message":"w"}})");
    const auto* problem = std::get_if<bspd::ProblemEvent>(&event);
    REQUIRE(problem != nullptr);
    REQUIRE(problem->problem.severity == bspd::ProblemSeverity::kWarning);
    REQUIRE_FALSE(problem->problem.position.source_file.has_value());
    REQUIRE_FALSE(problem->problem.diagnostic_code.has_value());
  }

  SECTION("empty source file means none") {
    auto event = ParseOne(
        R"({"event":"problem","problem":{"severity":"info","message":"i",)"
        R"("position":{"sourceFile":"","pointer":4}}})");
    const auto* problem = std::get_if<bspd::ProblemEvent>(&event);
    REQUIRE(problem != nullptr);
    REQUIRE_FALSE(problem->problem.position.source_file.has_value());
    REQUIRE(problem->problem.position.pointer == 4);
  }

  SECTION("source file as URI") {
    auto event = ParseOne(
        R"({"event":"problem","problem":{"severity":"info","message":"i",)"
        R"("position":{"sourceFile":"file:///src/My%20File.scala"}}})");
    const auto* problem = std::get_if<bspd::ProblemEvent>(&event);
    REQUIRE(problem != nullptr);
    REQUIRE(
        problem->problem.position.source_file->String() ==
        "/src/My File.scala");
  }
}

TEST_CASE("CompilerEventReader parses fileVisited events", "[event_reader]") {
  auto event = ParseOne(R"({"event":"fileVisited","file":"/src/B.scala"})");
  const auto* visited = std::get_if<bspd::FileVisitedEvent>(&event);
  REQUIRE(visited != nullptr);
  REQUIRE(visited->file.ToUri() == "file:///src/B.scala");
}

TEST_CASE("CompilerEventReader skips blank lines", "[event_reader]") {
  CompilerEventReader reader;
  auto empty = reader.ParseLine("", 1);
  REQUIRE(empty.has_value());
  REQUIRE_FALSE(empty->has_value());

  auto spaces = reader.ParseLine("  \t\r", 2);
  REQUIRE(spaces.has_value());
  REQUIRE_FALSE(spaces->has_value());
}

TEST_CASE("CompilerEventReader rejects bad lines", "[event_reader]") {
  CompilerEventReader reader;

  SECTION("malformed JSON") {
    auto result = reader.ParseLine("{not json", 7);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == BspdErrorCode::kInvalidEvent);
    REQUIRE_THAT(
        result.error().Message(), Catch::Matchers::ContainsSubstring("line 7"));
  }

  SECTION("missing event field") {
    auto result = reader.ParseLine(R"({"kind":"start"})", 2);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == BspdErrorCode::kInvalidEvent);
  }

  SECTION("unknown event") {
    auto result = reader.ParseLine(R"({"event":"explode"})", 3);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == BspdErrorCode::kUnknownEvent);
    REQUIRE_THAT(
        result.error().Message(), Catch::Matchers::ContainsSubstring("explode"));
  }

  SECTION("problem without payload") {
    auto result = reader.ParseLine(R"({"event":"problem"})", 1);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == BspdErrorCode::kInvalidEvent);
  }

  SECTION("invalid severity") {
    auto result = reader.ParseLine(
        R"({"event":"problem","problem":{"severity":"fatal","message":"x"}})",
        1);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == BspdErrorCode::kInvalidEvent);
  }

  SECTION("fileVisited without file") {
    auto result = reader.ParseLine(R"({"event":"fileVisited"})", 1);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == BspdErrorCode::kInvalidEvent);
  }
}

TEST_CASE("CompilerEventReader ReadAll", "[event_reader]") {
  CompilerEventReader reader;

  SECTION("reads every event in order") {
    std::istringstream input(
        "{\"event\":\"start\"}\n"
        "\n"
        "{\"event\":\"fileVisited\",\"file\":\"/src/A.scala\"}\n"
        "{\"event\":\"finish\"}\n");
    auto events = reader.ReadAll(input);
    REQUIRE(events.has_value());
    REQUIRE(events->size() == 3);
    REQUIRE(std::holds_alternative<bspd::StartEvent>((*events)[0]));
    REQUIRE(std::holds_alternative<bspd::FileVisitedEvent>((*events)[1]));
    REQUIRE(std::holds_alternative<bspd::FinishEvent>((*events)[2]));
  }

  SECTION("stops at the first bad line") {
    std::istringstream input(
        "{\"event\":\"start\"}\n"
        "{\"event\":\"bogus\"}\n"
        "{\"event\":\"finish\"}\n");
    auto events = reader.ReadAll(input);
    REQUIRE_FALSE(events.has_value());
    REQUIRE(events.error().Code() == BspdErrorCode::kUnknownEvent);
    REQUIRE_THAT(
        events.error().Message(), Catch::Matchers::ContainsSubstring("line 2"));
  }
}

TEST_CASE("CompilerEventReader Dispatch drives the reporter", "[event_reader]") {
  auto client = std::make_shared<bspd::test::RecordingBuildClient>();
  bspd::BspCompileProblemReporter reporter(
      client, bsp::BuildTargetIdentifier{.uri = "file:///work/app"}, "app",
      bsp::TaskId{.id = "app-compile"}, std::nullopt);

  CompilerEventReader reader;
  std::istringstream input(
      "{\"event\":\"start\"}\n"
      "{\"event\":\"problem\",\"problem\":{\"severity\":\"error\","
      "\"message\":\"boom\",\"position\":{\"sourceFile\":\"/src/A.scala\","
      "\"line\":2,\"pointer\":5}}}\n"
      "{\"event\":\"fileVisited\",\"file\":\"/src/B.scala\"}\n"
      "{\"event\":\"summary\"}\n"
      "{\"event\":\"finish\"}\n");
  auto events = reader.ReadAll(input);
  REQUIRE(events.has_value());

  for (const auto& event : *events) {
    CompilerEventReader::Dispatch(event, reporter);
  }

  REQUIRE(client->Started().size() == 1);
  REQUIRE(client->Finished().size() == 1);
  REQUIRE(client->Finished()[0].status == bsp::StatusCode::kError);

  auto published = client->Published();
  REQUIRE(published.size() == 2);
  REQUIRE(published[0].textDocument.uri == "file:///src/A.scala");
  REQUIRE(
      published[0].diagnostics[0].range.start ==
      bsp::Position{.line = 1, .character = 5});
  REQUIRE(published[1].textDocument.uri == "file:///src/B.scala");
  REQUIRE(published[1].diagnostics.empty());
}
