#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "bsp/rpc_build_client.hpp"
#include "bspd/compiler/compiler_event_reader.hpp"
#include "bspd/core/config_reader.hpp"
#include "bspd/error/error.hpp"
#include "bspd/reporter/bsp_compile_problem_reporter.hpp"

using bsp::RpcBuildClient;
using bspd::BspCompileProblemReporter;
using bspd::CanonicalPath;
using bspd::CompilerEventReader;
using bspd::ConfigReader;
using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;

auto main(int argc, char* argv[]) -> int {
  // Parse command-line arguments
  const std::vector<std::string> args(argv, argv + argc);
  auto options = app::ParseCommandLine(args);
  if (!options) {
    spdlog::error(
        "Usage: <executable> --pipe=<pipe name> --config=<path> "
        "[--events=<path>]");
    return 1;
  }

  // Load the compile task description
  auto config = ConfigReader().Load(CanonicalPath(options->config_path));
  if (!config) {
    spdlog::error(
        "{}",
        bspd::BspdError::Make(
            bspd::BspdErrorCode::kInvalidConfig, options->config_path)
            .Message());
    return 1;
  }

  // Setup loggers
  auto loggers = app::SetupLoggers(config->GetLogLevel());

  // Read the compiler event stream before connecting, so a malformed stream
  // never opens a task on the client
  std::ifstream events_file;
  std::istream* events_input = &std::cin;
  if (options->events_path) {
    events_file.open(*options->events_path);
    if (!events_file) {
      spdlog::error(
          "{}", bspd::BspdError::Make(
                    bspd::BspdErrorCode::kFileNotFound, *options->events_path)
                    .Message());
      return 1;
    }
    events_input = &events_file;
  }

  auto events = CompilerEventReader(loggers["bspd"]).ReadAll(*events_input);
  if (!events) {
    spdlog::error("Invalid event stream: {}", events.error().Message());
    return 1;
  }

  // Create the IO context
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  // Create transport and endpoint
  auto transport = std::make_unique<FramedPipeTransport>(
      executor, options->pipe_name, false, loggers["transport"]);

  auto endpoint = std::make_shared<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  // Create the build client and the reporter for this compile task
  auto client =
      std::make_shared<RpcBuildClient>(executor, endpoint, loggers["bspd"]);

  const auto& target = config->GetTarget();
  const auto& task = config->GetTask();
  auto reporter = std::make_shared<BspCompileProblemReporter>(
      client, target.id, target.display_name, bsp::TaskId{.id = task.id},
      task.origin_id, loggers["bspd"]);

  int exit_code = 0;

  asio::co_spawn(
      io_context,
      [&]() -> asio::awaitable<void> {
        auto started = co_await endpoint->Start();
        if (!started.has_value()) {
          spdlog::error("Endpoint error: {}", started.error().Message());
          exit_code = 1;
          co_return;
        }

        for (const auto& event : *events) {
          CompilerEventReader::Dispatch(event, *reporter);
        }
        // No-op if the stream already finished the task
        reporter->Finish();

        loggers["bspd"]->debug(
            "Draining {} pending notifications", client->PendingSends());
        co_await client->WaitForPendingSends();
        if (client->FailedSends() > 0) {
          spdlog::error(
              "{} notifications could not be delivered",
              client->FailedSends());
          exit_code = 1;
        }

        auto shutdown = co_await endpoint->Shutdown();
        if (!shutdown.has_value()) {
          spdlog::error(
              "Endpoint shutdown error: {}", shutdown.error().Message());
          exit_code = 1;
        }
        co_return;
      },
      asio::detached);

  io_context.run();
  return exit_code;
}
