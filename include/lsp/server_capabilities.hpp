#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

enum class TextDocumentSyncKind {
  kNone = 0,
  kFull = 1,
  kIncremental = 2,
};

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k);
void from_json(const nlohmann::json& j, TextDocumentSyncKind& k);

struct SaveOptions {
  std::optional<bool> includeText;
};

void to_json(nlohmann::json& j, const SaveOptions& o);
void from_json(const nlohmann::json& j, SaveOptions& o);

struct TextDocumentSyncOptions {
  std::optional<bool> openClose;
  std::optional<TextDocumentSyncKind> change;
  std::optional<SaveOptions> save;
};

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o);
void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o);

struct CompletionOptions {
  std::optional<std::vector<std::string>> triggerCharacters;
  std::optional<bool> resolveProvider;
};

void to_json(nlohmann::json& j, const CompletionOptions& o);
void from_json(const nlohmann::json& j, CompletionOptions& o);

struct CodeActionOptions {
  std::optional<std::vector<std::string>> codeActionKinds;
  std::optional<bool> resolveProvider;
};

void to_json(nlohmann::json& j, const CodeActionOptions& o);
void from_json(const nlohmann::json& j, CodeActionOptions& o);

struct ExecuteCommandOptions {
  std::vector<std::string> commands;
};

void to_json(nlohmann::json& j, const ExecuteCommandOptions& o);
void from_json(const nlohmann::json& j, ExecuteCommandOptions& o);

// Providers the server does not offer stay unset and are omitted on the wire
struct ServerCapabilities {
  std::optional<PositionEncodingKind> positionEncoding =
      PositionEncodingKind::kUtf16;
  std::optional<TextDocumentSyncOptions> textDocumentSync = std::nullopt;
  std::optional<CompletionOptions> completionProvider = std::nullopt;
  std::optional<bool> hoverProvider = std::nullopt;
  std::optional<bool> definitionProvider = std::nullopt;
  std::optional<CodeActionOptions> codeActionProvider = std::nullopt;
  std::optional<ExecuteCommandOptions> executeCommandProvider = std::nullopt;
};

void to_json(nlohmann::json& j, const ServerCapabilities& o);
void from_json(const nlohmann::json& j, ServerCapabilities& o);

}  // namespace lsp
