#include "maills/core/maills_lsp_server.hpp"

#include <algorithm>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lsp/document_features.hpp"
#include "lsp/window.hpp"
#include "maills/services/resolution_engine.hpp"
#include "maills/utils/canonical_path.hpp"

namespace maills {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

constexpr std::string_view kServerName = "maills";
constexpr std::string_view kServerVersion = "0.1.0";
constexpr std::string_view kFileWatcherId = "maills-contact-watcher";
constexpr std::string_view kDidChangeWatchedFilesMethod =
    "workspace/didChangeWatchedFiles";
constexpr std::string_view kVCardGlob = "**/*.vcf";

auto ToDocumentEdit(const lsp::TextDocumentContentChangeEvent& change)
    -> services::DocumentEdit {
  if (const auto* partial =
          std::get_if<lsp::TextDocumentContentPartialChangeEvent>(&change)) {
    return {.range = partial->range, .text = partial->text};
  }
  return {
      .range = std::nullopt,
      .text = std::get<lsp::TextDocumentContentFullChangeEvent>(change).text};
}

}  // namespace

auto NegotiatePositionEncoding(const lsp::InitializeParams& params)
    -> lsp::PositionEncodingKind {
  if (!params.capabilities || !params.capabilities->general ||
      !params.capabilities->general->positionEncodings) {
    return lsp::PositionEncodingKind::kUtf16;
  }
  const auto& offered = *params.capabilities->general->positionEncodings;
  if (std::ranges::find(offered, "utf-8") != offered.end()) {
    return lsp::PositionEncodingKind::kUtf8;
  }
  return lsp::PositionEncodingKind::kUtf16;
}

auto BuildServerCapabilities(
    const FeatureToggles& features, lsp::PositionEncodingKind encoding)
    -> lsp::ServerCapabilities {
  lsp::ServerCapabilities capabilities{
      .positionEncoding = encoding,
      .textDocumentSync =
          lsp::TextDocumentSyncOptions{
              .openClose = true,
              .change = lsp::TextDocumentSyncKind::kIncremental,
              .save = lsp::SaveOptions{.includeText = false},
          },
      .executeCommandProvider =
          lsp::ExecuteCommandOptions{
              .commands =
                  {std::string(services::kCreateContactCommand),
                   std::string(services::kReloadContactsCommand)},
          },
  };

  if (features.completion) {
    capabilities.completionProvider = lsp::CompletionOptions{
        .triggerCharacters = std::vector<std::string>{"<", "@"},
        .resolveProvider = true,
    };
  }
  if (features.hover) {
    capabilities.hoverProvider = true;
  }
  if (features.goto_definition) {
    capabilities.definitionProvider = true;
  }
  if (features.code_actions) {
    capabilities.codeActionProvider = lsp::CodeActionOptions{
        .codeActionKinds = std::vector<std::string>{
            std::string(lsp::code_action_kind::kQuickFix)},
    };
  }
  return capabilities;
}

auto BuildContactWatchers(
    const ServerConfig& config, bool relative_pattern_support)
    -> std::vector<lsp::FileSystemWatcher> {
  std::vector<lsp::FileSystemWatcher> watchers;

  if (config.vcard_dir) {
    CanonicalPath dir(*config.vcard_dir);
    if (relative_pattern_support) {
      watchers.push_back({.globPattern = lsp::RelativePattern{
                              .baseUri = dir.ToUri(),
                              .pattern = std::string(kVCardGlob),
                          }});
    } else {
      watchers.push_back(
          {.globPattern =
               fmt::format("{}/{}", dir.Path().generic_string(), kVCardGlob)});
    }
  }

  if (config.contact_list_file) {
    CanonicalPath file(*config.contact_list_file);
    if (relative_pattern_support) {
      watchers.push_back({.globPattern = lsp::RelativePattern{
                              .baseUri = file.Parent().ToUri(),
                              .pattern = file.Path().filename().string(),
                          }});
    } else {
      watchers.push_back({.globPattern = file.Path().generic_string()});
    }
  }

  return watchers;
}

auto ParseCreateContactArguments(
    const std::optional<std::vector<nlohmann::json>>& arguments)
    -> std::expected<mail::Mailbox, LspError> {
  if (!arguments || arguments->empty() || !arguments->front().is_object()) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams,
        "create_contact expects [{\"email\": ..., \"name\": ...}]");
  }

  const auto& argument = arguments->front();
  auto email = argument.find("email");
  if (email == argument.end() || !email->is_string()) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams, "create_contact requires an email");
  }

  mail::Mailbox mailbox{.address = email->get<std::string>()};
  if (!mail::IsValidAddress(mailbox.address)) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams,
        fmt::format("Not an email address: {}", mailbox.address));
  }

  auto name = argument.find("name");
  if (name != argument.end() && name->is_string() &&
      !name->get<std::string>().empty()) {
    mailbox.name = name->get<std::string>();
  }
  return mailbox;
}

auto LoadWarningsToJson(const std::vector<contacts::LoadWarning>& warnings)
    -> nlohmann::json {
  auto result = nlohmann::json::array();
  for (const auto& warning : warnings) {
    result.push_back(
        {{"kind", contacts::ToString(warning.kind)},
         {"path", warning.path.String()},
         {"message", warning.message}});
  }
  return result;
}

MaillsLspServer::MaillsLspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<LanguageServiceBase> language_service,
    std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      language_service_(std::move(language_service)) {
  language_service_->SetDiagnosticPublisher(
      [this](
          std::string uri, int version,
          std::vector<lsp::Diagnostic> diagnostics) {
        auto coroutine =
            [this, uri = std::move(uri), version,
             diagnostics = std::move(diagnostics)]() -> asio::awaitable<void> {
          co_await PublishDiagnostics(
              {.uri = uri,
               .version = version > 0 ? std::optional<int>(version)
                                      : std::nullopt,
               .diagnostics = diagnostics});
        };
        asio::co_spawn(executor_, std::move(coroutine), asio::detached);
      });
}

auto MaillsLspServer::ShuttingDown() -> std::unexpected<LspError> {
  return LspError::UnexpectedFromCode(
      LspErrorCode::kInvalidRequest, "Server is shutting down");
}

auto MaillsLspServer::ClientSupportsShowDocument() const -> bool {
  return client_capabilities_ && client_capabilities_->window &&
         client_capabilities_->window->showDocument &&
         client_capabilities_->window->showDocument->support;
}

auto MaillsLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, lsp::LspError>> {
  if (shutdown_requested_) {
    co_return ShuttingDown();
  }

  auto config = LoadServerConfig(params.initializationOptions, logger_);
  if (!config) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams, config.error().message());
  }

  auto encoding = NegotiatePositionEncoding(params);
  client_capabilities_ = params.capabilities;
  auto capabilities = BuildServerCapabilities(config->features, encoding);
  language_service_->Configure(std::move(*config), encoding);

  if (params.clientInfo) {
    logger_->info(
        "Initializing for {} {}", params.clientInfo->name,
        params.clientInfo->version.value_or(""));
  }

  co_return lsp::InitializeResult{
      .capabilities = capabilities,
      .serverInfo = lsp::InitializeResult::ServerInfo{
          .name = std::string(kServerName),
          .version = std::string(kServerVersion)}};
}

auto MaillsLspServer::RegisterContactWatchers() -> asio::awaitable<void> {
  const auto& watch_caps =
      client_capabilities_ && client_capabilities_->workspace
          ? client_capabilities_->workspace->didChangeWatchedFiles
          : std::nullopt;
  if (!watch_caps || !watch_caps->dynamicRegistration.value_or(false)) {
    Logger()->debug("Client cannot register file watchers dynamically");
    co_return;
  }

  auto watchers = BuildContactWatchers(
      language_service_->Config(),
      watch_caps->relativePatternSupport.value_or(false));
  if (watchers.empty()) {
    co_return;
  }

  Logger()->info("Registering {} contact file watcher(s)", watchers.size());
  auto registration = lsp::Registration{
      .id = std::string(kFileWatcherId),
      .method = std::string(kDidChangeWatchedFilesMethod),
      .registerOptions =
          lsp::DidChangeWatchedFilesRegistrationOptions{
              .watchers = std::move(watchers),
          },
  };
  auto result = co_await RegisterCapability(
      lsp::RegistrationParams{.registrations = {registration}});
  if (!result) {
    Logger()->error(
        "Failed to register contact file watchers: {}",
        result.error().Message());
  }
}

auto MaillsLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  initialized_ = true;

  // Queries are answered from the empty index until the load finishes
  language_service_->StartContactLoad();

  asio::co_spawn(
      executor_,
      [this]() -> asio::awaitable<void> { co_await RegisterContactWatchers(); },
      asio::detached);
  co_return Ok();
}

auto MaillsLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, lsp::LspError>> {
  shutdown_requested_ = true;
  co_return lsp::ShutdownResult{};
}

auto MaillsLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  co_await lsp::LspServer::Shutdown();
  co_return Ok();
}

auto MaillsLspServer::OnDidOpenTextDocument(
    lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  const auto& text_doc = params.textDocument;
  Logger()->debug("OnDidOpenTextDocument received: {}", text_doc.uri);

  co_await language_service_->OnDocumentOpened(
      text_doc.uri, text_doc.text, text_doc.version);
  co_return Ok();
}

auto MaillsLspServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidChangeTextDocument received: {} (version {})",
      params.textDocument.uri, params.textDocument.version);

  std::vector<services::DocumentEdit> edits;
  edits.reserve(params.contentChanges.size());
  for (const auto& change : params.contentChanges) {
    edits.push_back(ToDocumentEdit(change));
  }

  co_return co_await language_service_->OnDocumentChanged(
      params.textDocument.uri, params.textDocument.version, std::move(edits));
}

auto MaillsLspServer::OnDidSaveTextDocument(
    lsp::DidSaveTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidSaveTextDocument received: {}", params.textDocument.uri);
  co_await language_service_->OnDocumentSaved(params.textDocument.uri);
  co_return Ok();
}

auto MaillsLspServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidCloseTextDocument received: {}", params.textDocument.uri);
  co_return co_await language_service_->OnDocumentClosed(
      params.textDocument.uri);
}

auto MaillsLspServer::OnGotoDefinition(lsp::DefinitionParams params)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, lsp::LspError>> {
  if (shutdown_requested_) {
    co_return ShuttingDown();
  }
  Logger()->debug("OnGotoDefinition received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetDefinition(
      params.textDocument.uri, params.position);
}

auto MaillsLspServer::OnHover(lsp::HoverParams params)
    -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>> {
  if (shutdown_requested_) {
    co_return ShuttingDown();
  }
  Logger()->debug("OnHover received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetHover(
      params.textDocument.uri, params.position);
}

auto MaillsLspServer::OnCompletion(lsp::CompletionParams params)
    -> asio::awaitable<std::expected<lsp::CompletionList, lsp::LspError>> {
  if (shutdown_requested_) {
    co_return ShuttingDown();
  }
  Logger()->debug("OnCompletion received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetCompletions(
      params.textDocument.uri, params.position);
}

auto MaillsLspServer::OnCompletionItemResolve(
    lsp::CompletionItemResolveParams params)
    -> asio::awaitable<
        std::expected<lsp::CompletionItemResolveResult, lsp::LspError>> {
  if (shutdown_requested_) {
    co_return ShuttingDown();
  }
  co_return co_await language_service_->ResolveCompletionItem(
      std::move(params));
}

auto MaillsLspServer::OnCodeAction(lsp::CodeActionParams params)
    -> asio::awaitable<std::expected<lsp::CodeActionResult, lsp::LspError>> {
  if (shutdown_requested_) {
    co_return ShuttingDown();
  }
  Logger()->debug("OnCodeAction received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetCodeActions(
      params.textDocument.uri, params.range);
}

auto MaillsLspServer::OnDidChangeWatchedFiles(
    lsp::DidChangeWatchedFilesParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->info(
      "OnDidChangeWatchedFiles received: {} file change(s)",
      params.changes.size());
  for (const auto& change : params.changes) {
    co_await language_service_->HandleContactSourceChange(
        change.uri, change.type);
  }
  co_return Ok();
}

auto MaillsLspServer::RunCreateContact(
    const std::optional<std::vector<nlohmann::json>>& arguments)
    -> asio::awaitable<std::expected<lsp::ExecuteCommandResult, LspError>> {
  auto mailbox = ParseCreateContactArguments(arguments);
  if (!mailbox) {
    co_return std::unexpected(mailbox.error());
  }

  auto path = co_await language_service_->CreateContact(std::move(*mailbox));
  if (!path) {
    co_return std::unexpected(path.error());
  }

  auto uri = path->ToUri();
  if (ClientSupportsShowDocument()) {
    auto show = [this, uri]() -> asio::awaitable<void> {
      auto result = co_await ShowDocument(
          lsp::ShowDocumentParams{.uri = uri, .takeFocus = true});
      if (result && !result->success) {
        Logger()->warn("Client did not open {}", uri);
      }
    };
    asio::co_spawn(executor_, std::move(show), asio::detached);
  }

  co_return nlohmann::json{{"uri", uri}};
}

auto MaillsLspServer::RunReloadContacts()
    -> asio::awaitable<std::expected<lsp::ExecuteCommandResult, LspError>> {
  auto warnings = co_await language_service_->ReloadContacts();
  co_return nlohmann::json{{"warnings", LoadWarningsToJson(warnings)}};
}

auto MaillsLspServer::OnExecuteCommand(lsp::ExecuteCommandParams params)
    -> asio::awaitable<
        std::expected<lsp::ExecuteCommandResult, lsp::LspError>> {
  if (shutdown_requested_) {
    co_return ShuttingDown();
  }
  Logger()->debug("OnExecuteCommand received: {}", params.command);

  if (params.command == services::kCreateContactCommand) {
    co_return co_await RunCreateContact(params.arguments);
  }
  if (params.command == services::kReloadContactsCommand) {
    co_return co_await RunReloadContacts();
  }
  co_return LspError::UnexpectedFromCode(
      LspErrorCode::kInvalidParams,
      fmt::format("Unknown command: {}", params.command));
}

}  // namespace maills
