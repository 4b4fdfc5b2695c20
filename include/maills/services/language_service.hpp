#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "maills/contacts/contact_store.hpp"
#include "maills/core/language_service_base.hpp"
#include "maills/services/document_store.hpp"
#include "maills/services/resolution_engine.hpp"

namespace maills::services {

// Owns the contact index and the open documents and answers every query
// from one snapshot of each. Contact loads run on a dedicated thread and
// publish a new index atomically when they finish.
class LanguageService : public LanguageServiceBase {
 public:
  explicit LanguageService(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LanguageService(const LanguageService&) = delete;
  LanguageService(LanguageService&&) = delete;
  auto operator=(const LanguageService&) -> LanguageService& = delete;
  auto operator=(LanguageService&&) -> LanguageService& = delete;

  ~LanguageService() override = default;

  auto SetDiagnosticPublisher(DiagnosticPublisher publisher) -> void override {
    diagnostic_publisher_ = std::move(publisher);
  }

  auto Configure(ServerConfig config, lsp::PositionEncodingKind encoding)
      -> void override;

  [[nodiscard]] auto Config() const -> const ServerConfig& override {
    return config_;
  }

  auto StartContactLoad() -> void override;

  auto ReloadContacts()
      -> asio::awaitable<std::vector<contacts::LoadWarning>> override;

  auto HandleContactSourceChange(
      std::string uri, lsp::FileChangeType change_type)
      -> asio::awaitable<void> override;

  auto OnDocumentOpened(std::string uri, std::string content, int version)
      -> asio::awaitable<void> override;

  auto OnDocumentChanged(
      std::string uri, int version, std::vector<DocumentEdit> edits)
      -> asio::awaitable<std::expected<void, LspError>> override;

  auto OnDocumentSaved(std::string uri) -> asio::awaitable<void> override;

  auto OnDocumentClosed(std::string uri)
      -> asio::awaitable<std::expected<void, LspError>> override;

  auto GetHover(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> override;

  auto GetDefinition(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<std::optional<lsp::Location>, LspError>> override;

  auto GetCompletions(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::CompletionList, LspError>> override;

  auto ResolveCompletionItem(lsp::CompletionItem item)
      -> asio::awaitable<std::expected<lsp::CompletionItem, LspError>> override;

  auto GetCodeActions(std::string uri, lsp::Range range)
      -> asio::awaitable<
          std::expected<std::vector<lsp::CodeAction>, LspError>> override;

  auto CreateContact(mail::Mailbox mailbox)
      -> asio::awaitable<std::expected<CanonicalPath, LspError>> override;

  // Current index snapshot
  [[nodiscard]] auto Contacts() const
      -> std::shared_ptr<const contacts::ContactIndex> {
    return contact_store_.Current();
  }

  // Contact file changes are coalesced over this window
  static constexpr auto kReloadDebounceDelay = std::chrono::milliseconds(300);

 private:
  auto MakeEngine(std::string uri) -> asio::awaitable<ResolutionEngine>;

  // Loads all sources on the loader thread and installs the index
  auto LoadAndInstall() -> asio::awaitable<std::vector<contacts::LoadWarning>>;

  // Runs one reload, or marks one as pending while another is running
  auto RunScheduledReload() -> asio::awaitable<void>;

  auto ScheduleDebouncedReload() -> void;

  auto IsContactSource(const CanonicalPath& path) const -> bool;

  auto PublishDiagnostics(const DocumentSnapshot& document) -> void;

  auto RepublishAllDiagnostics() -> asio::awaitable<void>;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  ServerConfig config_;
  contacts::ContactStore contact_store_;
  DocumentStore documents_;

  // Single thread, so loads never overlap and install in order
  std::unique_ptr<asio::thread_pool> loader_pool_;

  std::optional<asio::steady_timer> reload_timer_;
  bool reload_in_progress_ = false;
  bool reload_pending_ = false;

  DiagnosticPublisher diagnostic_publisher_;
};

}  // namespace maills::services
