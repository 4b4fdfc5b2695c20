#pragma once

#include <expected>
#include <functional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/document_features.hpp>
#include <lsp/error.hpp>
#include <lsp/workspace.hpp>

#include "maills/contacts/contact.hpp"
#include "maills/core/server_config.hpp"
#include "maills/mail/mailbox.hpp"
#include "maills/services/document_store.hpp"
#include "maills/utils/canonical_path.hpp"

namespace maills {

using lsp::error::LspError;

// Domain operations behind the protocol layer. The server only translates
// LSP messages into these calls.
class LanguageServiceBase {
 public:
  LanguageServiceBase() = default;
  LanguageServiceBase(const LanguageServiceBase&) = default;
  LanguageServiceBase(LanguageServiceBase&&) = delete;
  auto operator=(const LanguageServiceBase&) -> LanguageServiceBase& = default;
  auto operator=(LanguageServiceBase&&) -> LanguageServiceBase& = delete;
  virtual ~LanguageServiceBase() = default;

  using DiagnosticPublisher = std::function<void(
      std::string uri, int version, std::vector<lsp::Diagnostic>)>;

  virtual auto SetDiagnosticPublisher(DiagnosticPublisher publisher)
      -> void = 0;

  // Called once during initialize, before any document arrives
  virtual auto Configure(
      ServerConfig config, lsp::PositionEncodingKind encoding) -> void = 0;

  [[nodiscard]] virtual auto Config() const -> const ServerConfig& = 0;

  // Starts the first contact load without waiting for it
  virtual auto StartContactLoad() -> void = 0;

  // Loads every source now and installs the result
  virtual auto ReloadContacts()
      -> asio::awaitable<std::vector<contacts::LoadWarning>> = 0;

  // Watched contact files changed on disk
  virtual auto HandleContactSourceChange(
      std::string uri, lsp::FileChangeType change_type)
      -> asio::awaitable<void> = 0;

  // Document lifecycle events
  virtual auto OnDocumentOpened(
      std::string uri, std::string content, int version)
      -> asio::awaitable<void> = 0;

  virtual auto OnDocumentChanged(
      std::string uri, int version, std::vector<services::DocumentEdit> edits)
      -> asio::awaitable<std::expected<void, LspError>> = 0;

  virtual auto OnDocumentSaved(std::string uri) -> asio::awaitable<void> = 0;

  virtual auto OnDocumentClosed(std::string uri)
      -> asio::awaitable<std::expected<void, LspError>> = 0;

  // Queries, each failing with kCapabilityDisabled when turned off
  virtual auto GetHover(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> = 0;

  virtual auto GetDefinition(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<std::optional<lsp::Location>, LspError>> = 0;

  virtual auto GetCompletions(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::CompletionList, LspError>> = 0;

  virtual auto ResolveCompletionItem(lsp::CompletionItem item)
      -> asio::awaitable<std::expected<lsp::CompletionItem, LspError>> = 0;

  virtual auto GetCodeActions(std::string uri, lsp::Range range)
      -> asio::awaitable<
          std::expected<std::vector<lsp::CodeAction>, LspError>> = 0;

  // Writes a new vCard for mailbox and reloads the index
  virtual auto CreateContact(mail::Mailbox mailbox)
      -> asio::awaitable<std::expected<CanonicalPath, LspError>> = 0;
};

}  // namespace maills
