#include "maills/services/language_service.hpp"

#include <fmt/format.h>

#include "maills/contacts/contact_source_loader.hpp"
#include "maills/contacts/vcard_writer.hpp"
#include "maills/utils/canonical_path.hpp"
#include "maills/utils/path_utils.hpp"
#include "maills/utils/scoped_timer.hpp"

namespace maills::services {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

namespace {

auto ToLspError(const MaillsError& error) -> LspError {
  switch (error.code()) {
    case MaillsErrorCode::kStaleVersion:
      return LspError::FromCode(
          LspErrorCode::kDocumentVersionMismatch, error.message());
    case MaillsErrorCode::kUnknownDocument:
      return LspError::FromCode(
          LspErrorCode::kDocumentNotOpen, error.message());
    case MaillsErrorCode::kInvalidEdit:
    case MaillsErrorCode::kInvalidConfig:
      return LspError::FromCode(LspErrorCode::kInvalidParams, error.message());
    case MaillsErrorCode::kWriteFailed:
    case MaillsErrorCode::kFileNotFound:
    case MaillsErrorCode::kFileAccessDenied:
      return LspError::FromCode(LspErrorCode::kRequestFailed, error.message());
    default:
      return LspError::FromCode(LspErrorCode::kInternalError, error.message());
  }
}

auto Disabled(std::string_view feature) -> std::unexpected<LspError> {
  return LspError::UnexpectedFromCode(
      LspErrorCode::kCapabilityDisabled,
      fmt::format("{} is not supported", feature));
}

}  // namespace

LanguageService::LanguageService(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      documents_(executor, logger_),
      loader_pool_(std::make_unique<asio::thread_pool>(1)) {
  logger_->debug("LanguageService created");
}

auto LanguageService::Configure(
    ServerConfig config, lsp::PositionEncodingKind encoding) -> void {
  config_ = std::move(config);
  documents_.SetPositionEncoding(encoding);

  logger_->info(
      "LanguageService configured: vcard_dir={}, contact_list_file={}",
      config_.vcard_dir ? config_.vcard_dir->string() : "<none>",
      config_.contact_list_file ? config_.contact_list_file->string()
                                : "<none>");
  const auto& f = config_.features;
  logger_->debug(
      "Features: completion={} hover={} code_actions={} goto_definition={} "
      "diagnostics={}",
      f.completion, f.hover, f.code_actions, f.goto_definition, f.diagnostics);
}

auto LanguageService::StartContactLoad() -> void {
  asio::co_spawn(
      executor_,
      [this]() -> asio::awaitable<void> { co_await RunScheduledReload(); },
      asio::detached);
}

auto LanguageService::LoadAndInstall()
    -> asio::awaitable<std::vector<contacts::LoadWarning>> {
  auto sources = config_.ContactSources();

  auto warnings = co_await asio::co_spawn(
      loader_pool_->get_executor(),
      [this, sources = std::move(sources)]()
          -> asio::awaitable<std::vector<contacts::LoadWarning>> {
        auto result = contacts::LoadContacts(sources, logger_);
        auto installed = contact_store_.Install(std::move(result.index));
        logger_->info(
            "Installed contact index generation {} ({} addresses)",
            installed->Generation(), installed->AddressCount());
        co_return std::move(result.warnings);
      },
      asio::use_awaitable);

  // Back to the main executor before touching documents
  co_await asio::post(executor_, asio::use_awaitable);

  co_await RepublishAllDiagnostics();
  co_return warnings;
}

auto LanguageService::ReloadContacts()
    -> asio::awaitable<std::vector<contacts::LoadWarning>> {
  utils::ScopedTimer timer("Contact reload", logger_);
  co_return co_await LoadAndInstall();
}

auto LanguageService::RunScheduledReload() -> asio::awaitable<void> {
  if (reload_in_progress_) {
    reload_pending_ = true;
    logger_->debug("Contact reload in progress, marked as pending");
    co_return;
  }

  reload_in_progress_ = true;
  reload_pending_ = false;

  co_await LoadAndInstall();

  if (reload_pending_) {
    logger_->debug("Running pending contact reload");
    ScheduleDebouncedReload();
  }

  reload_in_progress_ = false;
}

auto LanguageService::ScheduleDebouncedReload() -> void {
  logger_->debug(
      "Scheduling debounced contact reload ({}ms delay)",
      kReloadDebounceDelay.count());

  if (reload_timer_) {
    reload_timer_->cancel();
  }

  reload_timer_ = asio::steady_timer(executor_, kReloadDebounceDelay);
  reload_timer_->async_wait([this](std::error_code ec) {
    if (!ec) {
      asio::co_spawn(
          executor_,
          [this]() -> asio::awaitable<void> { co_await RunScheduledReload(); },
          asio::detached);
    }
  });
}

auto LanguageService::IsContactSource(const CanonicalPath& path) const
    -> bool {
  if (config_.contact_list_file &&
      path == CanonicalPath(*config_.contact_list_file)) {
    return true;
  }
  return IsVCardFile(path.Path());
}

auto LanguageService::HandleContactSourceChange(
    std::string uri, lsp::FileChangeType change_type) -> asio::awaitable<void> {
  auto path = CanonicalPath::FromUri(uri);
  if (!IsContactSource(path)) {
    logger_->debug("Ignoring change to non-contact file {}", path);
    co_return;
  }

  logger_->debug(
      "Contact source {} changed (type {})", path,
      static_cast<int>(change_type));
  ScheduleDebouncedReload();
  co_return;
}

auto LanguageService::PublishDiagnostics(const DocumentSnapshot& document)
    -> void {
  if (!diagnostic_publisher_ || !config_.features.diagnostics) {
    return;
  }

  auto snapshot = std::make_shared<const DocumentSnapshot>(document);
  ResolutionEngine engine(
      snapshot, contact_store_.Current(), documents_.PositionEncoding(),
      logger_);
  diagnostic_publisher_(
      document.uri, document.version, engine.Diagnostics());
}

auto LanguageService::RepublishAllDiagnostics() -> asio::awaitable<void> {
  if (!diagnostic_publisher_ || !config_.features.diagnostics) {
    co_return;
  }

  auto documents = co_await documents_.GetAll();
  co_await asio::post(executor_, asio::use_awaitable);
  for (const auto& document : documents) {
    PublishDiagnostics(*document);
  }
}

auto LanguageService::OnDocumentOpened(
    std::string uri, std::string content, int version)
    -> asio::awaitable<void> {
  auto snapshot =
      co_await documents_.Open(std::move(uri), std::move(content), version);
  co_await asio::post(executor_, asio::use_awaitable);
  PublishDiagnostics(*snapshot);
}

auto LanguageService::OnDocumentChanged(
    std::string uri, int version, std::vector<DocumentEdit> edits)
    -> asio::awaitable<std::expected<void, LspError>> {
  auto result = co_await documents_.Change(uri, version, std::move(edits));
  co_await asio::post(executor_, asio::use_awaitable);

  if (!result) {
    logger_->warn("Rejected change to {}: {}", uri, result.error().message());
    co_return std::unexpected(ToLspError(result.error()));
  }

  PublishDiagnostics(**result);
  co_return lsp::error::Ok();
}

auto LanguageService::OnDocumentSaved(std::string uri)
    -> asio::awaitable<void> {
  logger_->debug("Document saved: {}", uri);
  co_return;
}

auto LanguageService::OnDocumentClosed(std::string uri)
    -> asio::awaitable<std::expected<void, LspError>> {
  auto result = co_await documents_.Close(uri);
  co_await asio::post(executor_, asio::use_awaitable);

  if (!result) {
    logger_->warn("Rejected close of {}: {}", uri, result.error().message());
    co_return std::unexpected(ToLspError(result.error()));
  }

  // Clear the hints the client still shows for the closed document
  if (diagnostic_publisher_ && config_.features.diagnostics) {
    diagnostic_publisher_(uri, 0, {});
  }
  co_return lsp::error::Ok();
}

auto LanguageService::MakeEngine(std::string uri)
    -> asio::awaitable<ResolutionEngine> {
  auto document = co_await documents_.Get(std::move(uri));
  co_await asio::post(executor_, asio::use_awaitable);
  co_return ResolutionEngine(
      std::move(document), contact_store_.Current(),
      documents_.PositionEncoding(), logger_);
}

auto LanguageService::GetHover(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> {
  if (!config_.features.hover) {
    co_return Disabled("Hover");
  }
  auto engine = co_await MakeEngine(std::move(uri));
  co_return engine.Hover(position);
}

auto LanguageService::GetDefinition(std::string uri, lsp::Position position)
    -> asio::awaitable<
        std::expected<std::optional<lsp::Location>, LspError>> {
  if (!config_.features.goto_definition) {
    co_return Disabled("Goto definition");
  }
  auto engine = co_await MakeEngine(std::move(uri));
  co_return engine.Definition(position);
}

auto LanguageService::GetCompletions(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::CompletionList, LspError>> {
  if (!config_.features.completion) {
    co_return Disabled("Completion");
  }
  utils::ScopedTimer timer("Completion", logger_, spdlog::level::trace);
  auto engine = co_await MakeEngine(std::move(uri));
  co_return engine.Completion(position);
}

auto LanguageService::ResolveCompletionItem(lsp::CompletionItem item)
    -> asio::awaitable<std::expected<lsp::CompletionItem, LspError>> {
  if (!config_.features.completion) {
    co_return Disabled("Completion");
  }
  ResolutionEngine engine(
      nullptr, contact_store_.Current(), documents_.PositionEncoding(),
      logger_);
  co_return engine.ResolveCompletionItem(std::move(item));
}

auto LanguageService::GetCodeActions(std::string uri, lsp::Range range)
    -> asio::awaitable<
        std::expected<std::vector<lsp::CodeAction>, LspError>> {
  if (!config_.features.code_actions) {
    co_return Disabled("Code actions");
  }
  auto engine = co_await MakeEngine(std::move(uri));
  co_return engine.CodeActions(range);
}

auto LanguageService::CreateContact(mail::Mailbox mailbox)
    -> asio::awaitable<std::expected<CanonicalPath, LspError>> {
  if (!config_.vcard_dir) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kRequestFailed,
        "Cannot create a contact without a configured vcard_dir");
  }
  if (!mail::IsValidAddress(mailbox.address)) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams,
        fmt::format("Not an email address: {}", mailbox.address));
  }

  auto written = contacts::WriteNewContact(*config_.vcard_dir, mailbox);
  if (!written) {
    logger_->error(
        "Failed to create contact for {}: {}", mailbox.address,
        written.error().message());
    co_return std::unexpected(ToLspError(written.error()));
  }
  logger_->info("Created contact {} at {}", mailbox.address, *written);

  // The new card must be visible before the command returns
  co_await ReloadContacts();
  co_return *written;
}

}  // namespace maills::services
