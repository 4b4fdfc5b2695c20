#include "lsp/lsp_server.hpp"

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

using lsp::error::LspError;
using lsp::error::Ok;

LspServer::LspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)) {
}

auto LspServer::Start() -> asio::awaitable<std::expected<void, LspError>> {
  RegisterHandlers();

  auto result = co_await endpoint_->Start();
  if (result.has_value()) {
    Logger()->debug("LspServer endpoint started");
  } else {
    Logger()->error("LspServer endpoint error: {}", result.error().Message());
    co_return LspError::UnexpectedFromRpcError(result.error());
  }

  auto shutdown_result = co_await endpoint_->WaitForShutdown();
  if (shutdown_result.has_value()) {
    Logger()->debug("LspServer endpoint wait for shutdown completed");
  } else {
    Logger()->error(
        "LspServer endpoint wait for shutdown error: {}",
        shutdown_result.error().Message());
    co_return LspError::UnexpectedFromRpcError(shutdown_result.error());
  }

  co_return Ok();
}

auto LspServer::Shutdown() -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug("Server shutting down");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (result.has_value()) {
      Logger()->debug("LspServer endpoint shutdown");
    } else {
      Logger()->error(
          "LspServer endpoint shutdown error: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
  }

  // Lets io_context::run return once pending work drains
  work_guard_.reset();

  co_return Ok();
}

void LspServer::RegisterHandlers() {
  RegisterLifecycleHandlers();
  RegisterDocumentSyncHandlers();
  RegisterLanguageFeatureHandlers();
  RegisterWorkspaceFeatureHandlers();
}

void LspServer::RegisterLifecycleHandlers() {
  endpoint_->RegisterMethodCall<InitializeParams, InitializeResult, LspError>(
      "initialize",
      [this](const InitializeParams& params) { return OnInitialize(params); });

  endpoint_->RegisterNotification<InitializedParams, LspError>(
      "initialized", [this](const InitializedParams& params) {
        return OnInitialized(params);
      });

  endpoint_->RegisterMethodCall<ShutdownParams, ShutdownResult, LspError>(
      "shutdown",
      [this](const ShutdownParams& params) { return OnShutdown(params); });

  endpoint_->RegisterNotification<ExitParams, LspError>(
      "exit", [this](const ExitParams& params) { return OnExit(params); });
}

void LspServer::RegisterDocumentSyncHandlers() {
  endpoint_->RegisterNotification<DidOpenTextDocumentParams, LspError>(
      "textDocument/didOpen", [this](const DidOpenTextDocumentParams& params) {
        return OnDidOpenTextDocument(params);
      });

  endpoint_->RegisterNotification<DidChangeTextDocumentParams, LspError>(
      "textDocument/didChange",
      [this](const DidChangeTextDocumentParams& params) {
        return OnDidChangeTextDocument(params);
      });

  endpoint_->RegisterNotification<DidSaveTextDocumentParams, LspError>(
      "textDocument/didSave", [this](const DidSaveTextDocumentParams& params) {
        return OnDidSaveTextDocument(params);
      });

  endpoint_->RegisterNotification<DidCloseTextDocumentParams, LspError>(
      "textDocument/didClose",
      [this](const DidCloseTextDocumentParams& params) {
        return OnDidCloseTextDocument(params);
      });
}

void LspServer::RegisterLanguageFeatureHandlers() {
  endpoint_->RegisterMethodCall<DefinitionParams, DefinitionResult, LspError>(
      "textDocument/definition", [this](const DefinitionParams& params) {
        return OnGotoDefinition(params);
      });

  endpoint_->RegisterMethodCall<HoverParams, HoverResult, LspError>(
      "textDocument/hover",
      [this](const HoverParams& params) { return OnHover(params); });

  endpoint_->RegisterMethodCall<CompletionParams, CompletionList, LspError>(
      "textDocument/completion",
      [this](const CompletionParams& params) { return OnCompletion(params); });

  endpoint_->RegisterMethodCall<
      CompletionItemResolveParams, CompletionItemResolveResult, LspError>(
      "completionItem/resolve",
      [this](const CompletionItemResolveParams& params) {
        return OnCompletionItemResolve(params);
      });

  endpoint_->RegisterMethodCall<CodeActionParams, CodeActionResult, LspError>(
      "textDocument/codeAction",
      [this](const CodeActionParams& params) { return OnCodeAction(params); });
}

void LspServer::RegisterWorkspaceFeatureHandlers() {
  endpoint_->RegisterNotification<DidChangeWatchedFilesParams, LspError>(
      "workspace/didChangeWatchedFiles",
      [this](const DidChangeWatchedFilesParams& params) {
        return OnDidChangeWatchedFiles(params);
      });

  endpoint_->RegisterMethodCall<
      ExecuteCommandParams, ExecuteCommandResult, LspError>(
      "workspace/executeCommand", [this](const ExecuteCommandParams& params) {
        return OnExecuteCommand(params);
      });
}

}  // namespace lsp
