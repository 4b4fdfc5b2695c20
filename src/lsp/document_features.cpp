#include "lsp/document_features.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Hover Request
void to_json(nlohmann::json& j, const HoverParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
}

void from_json(const nlohmann::json& j, HoverParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("position").get_to(p.position);
}

void to_json(nlohmann::json& j, const Hover& h) {
  j = nlohmann::json{{"contents", h.contents}};
  to_json_optional(j, "range", h.range);
}

void from_json(const nlohmann::json& j, Hover& h) {
  j.at("contents").get_to(h.contents);
  from_json_optional(j, "range", h.range);
}

void to_json(nlohmann::json& j, const HoverResult& r) {
  if (r.has_value()) {
    j = *r;
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, HoverResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<Hover>();
  }
}

// Completion Request
void to_json(nlohmann::json& j, const CompletionTriggerKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionTriggerKind& k) {
  k = static_cast<CompletionTriggerKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionContext& c) {
  j = nlohmann::json{{"triggerKind", c.triggerKind}};
  to_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void from_json(const nlohmann::json& j, CompletionContext& c) {
  j.at("triggerKind").get_to(c.triggerKind);
  from_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void to_json(nlohmann::json& j, const CompletionParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
  to_json_optional(j, "context", p.context);
}

void from_json(const nlohmann::json& j, CompletionParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("position").get_to(p.position);
  from_json_optional(j, "context", p.context);
}

void to_json(nlohmann::json& j, const InsertTextFormat& f) {
  j = static_cast<int>(f);
}

void from_json(const nlohmann::json& j, InsertTextFormat& f) {
  f = static_cast<InsertTextFormat>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionItemLabelDetails& d) {
  j = nlohmann::json::object();
  to_json_optional(j, "detail", d.detail);
  to_json_optional(j, "description", d.description);
}

void from_json(const nlohmann::json& j, CompletionItemLabelDetails& d) {
  from_json_optional(j, "detail", d.detail);
  from_json_optional(j, "description", d.description);
}

void to_json(nlohmann::json& j, const CompletionItemKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionItemKind& k) {
  k = static_cast<CompletionItemKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionItem& c) {
  j = nlohmann::json{{"label", c.label}};
  to_json_optional(j, "labelDetails", c.labelDetails);
  to_json_optional(j, "kind", c.kind);
  to_json_optional(j, "detail", c.detail);
  to_json_optional(j, "documentation", c.documentation);
  to_json_optional(j, "sortText", c.sortText);
  to_json_optional(j, "filterText", c.filterText);
  to_json_optional(j, "insertText", c.insertText);
  to_json_optional(j, "insertTextFormat", c.insertTextFormat);
  to_json_optional(j, "textEdit", c.textEdit);
  to_json_optional(j, "data", c.data);
}

void from_json(const nlohmann::json& j, CompletionItem& c) {
  j.at("label").get_to(c.label);
  from_json_optional(j, "labelDetails", c.labelDetails);
  from_json_optional(j, "kind", c.kind);
  from_json_optional(j, "detail", c.detail);
  // Clients may echo plain-string documentation; only markup is kept
  if (j.contains("documentation") && j.at("documentation").is_object()) {
    c.documentation = j.at("documentation").get<MarkupContent>();
  }
  from_json_optional(j, "sortText", c.sortText);
  from_json_optional(j, "filterText", c.filterText);
  from_json_optional(j, "insertText", c.insertText);
  from_json_optional(j, "insertTextFormat", c.insertTextFormat);
  if (j.contains("textEdit") && j.at("textEdit").contains("range")) {
    c.textEdit = j.at("textEdit").get<TextEdit>();
  }
  from_json_optional(j, "data", c.data);
}

void to_json(nlohmann::json& j, const CompletionList& c) {
  j = nlohmann::json{{"isIncomplete", c.isIncomplete}, {"items", c.items}};
}

void from_json(const nlohmann::json& j, CompletionList& c) {
  j.at("isIncomplete").get_to(c.isIncomplete);
  j.at("items").get_to(c.items);
}

// Code Action Request
void to_json(nlohmann::json& j, const CodeActionTriggerKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CodeActionTriggerKind& k) {
  k = static_cast<CodeActionTriggerKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CodeActionContext& c) {
  j = nlohmann::json{{"diagnostics", c.diagnostics}};
  to_json_optional(j, "only", c.only);
  to_json_optional(j, "triggerKind", c.triggerKind);
}

void from_json(const nlohmann::json& j, CodeActionContext& c) {
  j.at("diagnostics").get_to(c.diagnostics);
  from_json_optional(j, "only", c.only);
  from_json_optional(j, "triggerKind", c.triggerKind);
}

void to_json(nlohmann::json& j, const CodeActionParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument},
      {"range", p.range},
      {"context", p.context}};
}

void from_json(const nlohmann::json& j, CodeActionParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("range").get_to(p.range);
  j.at("context").get_to(p.context);
}

void to_json(nlohmann::json& j, const CodeAction& a) {
  j = nlohmann::json{{"title", a.title}};
  to_json_optional(j, "kind", a.kind);
  to_json_optional(j, "diagnostics", a.diagnostics);
  to_json_optional(j, "isPreferred", a.isPreferred);
  to_json_optional(j, "command", a.command);
}

void from_json(const nlohmann::json& j, CodeAction& a) {
  j.at("title").get_to(a.title);
  from_json_optional(j, "kind", a.kind);
  from_json_optional(j, "diagnostics", a.diagnostics);
  from_json_optional(j, "isPreferred", a.isPreferred);
  from_json_optional(j, "command", a.command);
}

}  // namespace lsp
