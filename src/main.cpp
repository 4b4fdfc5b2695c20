#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "maills/core/maills_lsp_server.hpp"
#include "maills/services/language_service.hpp"

using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;
using maills::MaillsLspServer;
using maills::services::LanguageService;

auto main(int argc, char* argv[]) -> int {
  const std::vector<std::string> args(argv, argv + argc);
  auto options = app::ParseCommandLine(args);
  if (!options) {
    spdlog::error(
        "Usage: maills --pipe=<pipe name> [--config=<config.yaml>] "
        "[--log-file=<path>]");
    return 1;
  }

  auto loggers = app::SetupLoggers(options->log_file);

  // An explicit config path takes the place of the usual lookup
  if (options->config_path) {
    ::setenv("MAILLS_CONFIG", options->config_path->c_str(), 1);
  }

  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto transport = std::make_unique<FramedPipeTransport>(
      executor, options->pipe_name, false, loggers["transport"]);

  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  auto language_service =
      std::make_shared<LanguageService>(executor, loggers["maills"]);
  auto server = std::make_unique<MaillsLspServer>(
      executor, std::move(endpoint), language_service, loggers["maills"]);

  asio::co_spawn(
      io_context,
      [&server]() -> asio::awaitable<void> {
        auto result = co_await server->Start();
        if (!result.has_value()) {
          spdlog::error("Server error: {}", result.error().Message());
        }
        co_return;
      },
      asio::detached);

  io_context.run();
  return 0;
}
