#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "bsp/diagnostic.hpp"
#include "bsp/error.hpp"
#include "bsp/task.hpp"

TEST_CASE("PublishDiagnosticsParams serialization", "[bsp]") {
  bsp::PublishDiagnosticsParams params{
      .textDocument = {.uri = "file:///src/A.scala"},
      .buildTarget = {.uri = "file:///work/app"},
      .originId = std::nullopt,
      .diagnostics =
          {bsp::Diagnostic{
              .range =
                  {.start = {.line = 9, .character = 2},
                   .end = {.line = 9, .character = 2}},
              .severity = bsp::DiagnosticSeverity::kError,
              .source = "bspd",
              .message = "boom",
          }},
      .reset = true,
  };

  nlohmann::json j = params;

  REQUIRE(j["textDocument"]["uri"] == "file:///src/A.scala");
  REQUIRE(j["buildTarget"]["uri"] == "file:///work/app");
  REQUIRE(j["reset"] == true);
  // Absent optionals are omitted rather than sent as null
  REQUIRE_FALSE(j.contains("originId"));

  const auto& diagnostic = j["diagnostics"][0];
  REQUIRE(diagnostic["severity"] == 1);
  REQUIRE(diagnostic["range"]["start"]["line"] == 9);
  REQUIRE(diagnostic["range"]["end"]["character"] == 2);
  REQUIRE(diagnostic["message"] == "boom");
  REQUIRE(diagnostic["source"] == "bspd");
  REQUIRE_FALSE(diagnostic.contains("code"));

  auto decoded = j.get<bsp::PublishDiagnosticsParams>();
  REQUIRE(decoded.textDocument == params.textDocument);
  REQUIRE(decoded.diagnostics == params.diagnostics);
  REQUIRE(decoded.reset);
}

TEST_CASE("DiagnosticSeverity rejects out of range values", "[bsp]") {
  nlohmann::json j = 5;
  bsp::DiagnosticSeverity severity{};
  REQUIRE_THROWS(from_json(j, severity));
}

TEST_CASE("TaskFinishParams serialization", "[bsp]") {
  bsp::CompileReport report{
      .target = {.uri = "file:///work/app"},
      .originId = "req-1",
      .errors = 2,
      .warnings = 3,
      .time = 120,
  };
  bsp::TaskFinishParams params{
      .taskId = {.id = "task1"},
      .originId = "req-1",
      .eventTime = 1700000000000,
      .message = "Compiled app",
      .status = bsp::StatusCode::kError,
      .dataKind = std::string(bsp::task_data_kind::kCompileReport),
      .data = nlohmann::json(report),
  };

  nlohmann::json j = params;

  REQUIRE(j["taskId"]["id"] == "task1");
  REQUIRE_FALSE(j["taskId"].contains("parents"));
  REQUIRE(j["status"] == 2);
  REQUIRE(j["dataKind"] == "compile-report");
  REQUIRE(j["data"]["errors"] == 2);
  REQUIRE(j["data"]["warnings"] == 3);
  REQUIRE(j["data"]["time"] == 120);
  REQUIRE(j["data"]["originId"] == "req-1");
  REQUIRE(j["data"]["target"]["uri"] == "file:///work/app");

  auto decoded = j.get<bsp::TaskFinishParams>();
  REQUIRE(decoded.status == bsp::StatusCode::kError);
  REQUIRE(decoded.eventTime == 1700000000000);
  REQUIRE(decoded.data->get<bsp::CompileReport>().warnings == 3);
}

TEST_CASE("StatusCode rejects unknown values", "[bsp]") {
  nlohmann::json j = 9;
  bsp::StatusCode status{};
  REQUIRE_THROWS(from_json(j, status));
}

TEST_CASE("TaskStartParams omits absent fields", "[bsp]") {
  bsp::TaskStartParams params{.taskId = {.id = "task1"}};

  nlohmann::json j = params;

  REQUIRE(j.size() == 1);
  REQUIRE(j["taskId"]["id"] == "task1");
}

TEST_CASE("BspError keeps the failed method", "[bsp]") {
  auto error = bsp::error::BspError::FromRpcError(
      "build/taskFinish",
      bsp::error::RpcError(
          bsp::error::RpcErrorCode::kTransportError, "pipe closed"));

  REQUIRE(error.Method() == "build/taskFinish");
  REQUIRE(error.Code() == bsp::error::RpcErrorCode::kTransportError);
  REQUIRE(error.Message() == "pipe closed");
}
