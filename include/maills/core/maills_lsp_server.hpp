#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"
#include "maills/core/language_service_base.hpp"

namespace maills {

// Picks utf-8 when the client lists it, else utf-16
auto NegotiatePositionEncoding(const lsp::InitializeParams& params)
    -> lsp::PositionEncodingKind;

// Capabilities for the effective config; disabled features are omitted
auto BuildServerCapabilities(
    const FeatureToggles& features, lsp::PositionEncodingKind encoding)
    -> lsp::ServerCapabilities;

// Watchers for **/*.vcf under vcard_dir and for the contact list file
auto BuildContactWatchers(
    const ServerConfig& config, bool relative_pattern_support)
    -> std::vector<lsp::FileSystemWatcher>;

// Reads [{"email": ..., "name": ...}] as passed by the code action
auto ParseCreateContactArguments(
    const std::optional<std::vector<nlohmann::json>>& arguments)
    -> std::expected<mail::Mailbox, LspError>;

// [{"kind": ..., "path": ..., "message": ...}, ...]
auto LoadWarningsToJson(const std::vector<contacts::LoadWarning>& warnings)
    -> nlohmann::json;

class MaillsLspServer : public lsp::LspServer {
 public:
  MaillsLspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<LanguageServiceBase> language_service,
      std::shared_ptr<spdlog::logger> logger = nullptr);

 private:
  // Server state
  bool initialized_ = false;
  bool shutdown_requested_ = false;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;
  std::shared_ptr<LanguageServiceBase> language_service_{nullptr};

  // Client capabilities from the initialize request
  std::optional<lsp::ClientCapabilities> client_capabilities_;

  [[nodiscard]] auto ClientSupportsShowDocument() const -> bool;

  // Answer to every request that arrives after shutdown
  static auto ShuttingDown() -> std::unexpected<LspError>;

  auto RegisterContactWatchers() -> asio::awaitable<void>;

  auto RunCreateContact(
      const std::optional<std::vector<nlohmann::json>>& arguments)
      -> asio::awaitable<std::expected<lsp::ExecuteCommandResult, LspError>>;

  auto RunReloadContacts()
      -> asio::awaitable<std::expected<lsp::ExecuteCommandResult, LspError>>;

 protected:
  // Initialize Request
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  // Initialized Notification
  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Shutdown Request
  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  // Exit Notification
  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Open Text Document Notification
  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Change Text Document Notification
  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Save Text Document Notification
  auto OnDidSaveTextDocument(lsp::DidSaveTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Close Text Document Notification
  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Goto Definition Request
  auto OnGotoDefinition(lsp::DefinitionParams params) -> asio::awaitable<
      std::expected<lsp::DefinitionResult, lsp::LspError>> override;

  // Hover Request
  auto OnHover(lsp::HoverParams params)
      -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>>
      override;

  // Completion Request
  auto OnCompletion(lsp::CompletionParams params)
      -> asio::awaitable<std::expected<lsp::CompletionList, lsp::LspError>>
      override;

  // Completion Item Resolve Request
  auto OnCompletionItemResolve(lsp::CompletionItemResolveParams params)
      -> asio::awaitable<
          std::expected<lsp::CompletionItemResolveResult, lsp::LspError>>
      override;

  // Code Action Request
  auto OnCodeAction(lsp::CodeActionParams params) -> asio::awaitable<
      std::expected<lsp::CodeActionResult, lsp::LspError>> override;

  // DidChangeWatchedFiles Notification
  auto OnDidChangeWatchedFiles(lsp::DidChangeWatchedFilesParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Execute Command Request
  auto OnExecuteCommand(lsp::ExecuteCommandParams params) -> asio::awaitable<
      std::expected<lsp::ExecuteCommandResult, lsp::LspError>> override;
};

}  // namespace maills
