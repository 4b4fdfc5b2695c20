#include "lsp/server_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& k) {
  k = static_cast<TextDocumentSyncKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const SaveOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "includeText", o.includeText);
}

void from_json(const nlohmann::json& j, SaveOptions& o) {
  from_json_optional(j, "includeText", o.includeText);
}

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "openClose", o.openClose);
  to_json_optional(j, "change", o.change);
  to_json_optional(j, "save", o.save);
}

void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o) {
  from_json_optional(j, "openClose", o.openClose);
  from_json_optional(j, "change", o.change);
  from_json_optional(j, "save", o.save);
}

void to_json(nlohmann::json& j, const CompletionOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "triggerCharacters", o.triggerCharacters);
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, CompletionOptions& o) {
  from_json_optional(j, "triggerCharacters", o.triggerCharacters);
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const CodeActionOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "codeActionKinds", o.codeActionKinds);
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, CodeActionOptions& o) {
  from_json_optional(j, "codeActionKinds", o.codeActionKinds);
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const ExecuteCommandOptions& o) {
  j = nlohmann::json{{"commands", o.commands}};
}

void from_json(const nlohmann::json& j, ExecuteCommandOptions& o) {
  j.at("commands").get_to(o.commands);
}

void to_json(nlohmann::json& j, const ServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncoding", o.positionEncoding);
  to_json_optional(j, "textDocumentSync", o.textDocumentSync);
  to_json_optional(j, "completionProvider", o.completionProvider);
  to_json_optional(j, "hoverProvider", o.hoverProvider);
  to_json_optional(j, "definitionProvider", o.definitionProvider);
  to_json_optional(j, "codeActionProvider", o.codeActionProvider);
  to_json_optional(j, "executeCommandProvider", o.executeCommandProvider);
}

void from_json(const nlohmann::json& j, ServerCapabilities& o) {
  from_json_optional(j, "positionEncoding", o.positionEncoding);
  from_json_optional(j, "textDocumentSync", o.textDocumentSync);
  from_json_optional(j, "completionProvider", o.completionProvider);
  from_json_optional(j, "hoverProvider", o.hoverProvider);
  from_json_optional(j, "definitionProvider", o.definitionProvider);
  from_json_optional(j, "codeActionProvider", o.codeActionProvider);
  from_json_optional(j, "executeCommandProvider", o.executeCommandProvider);
}

}  // namespace lsp
