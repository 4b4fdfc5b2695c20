#include "lsp/basic.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

void to_json(nlohmann::json& j, const PositionEncodingKind& p) {
  switch (p) {
    case PositionEncodingKind::kUtf8:
      j = "utf-8";
      break;
    case PositionEncodingKind::kUtf16:
      j = "utf-16";
      break;
    case PositionEncodingKind::kUtf32:
      j = "utf-32";
      break;
    default:
      throw std::runtime_error("Invalid position encoding kind");
  }
}

void from_json(const nlohmann::json& j, PositionEncodingKind& p) {
  std::string s = j.get<std::string>();
  if (s == "utf-8") {
    p = PositionEncodingKind::kUtf8;
  } else if (s == "utf-16") {
    p = PositionEncodingKind::kUtf16;
  } else if (s == "utf-32") {
    p = PositionEncodingKind::kUtf32;
  } else {
    throw std::runtime_error("Invalid position encoding kind");
  }
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Text Document Item
void to_json(nlohmann::json& j, const TextDocumentItem& t) {
  j = nlohmann::json{
      {"uri", t.uri},
      {"languageId", t.languageId},
      {"version", t.version},
      {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
  j.at("uri").get_to(t.uri);
  j.at("languageId").get_to(t.languageId);
  j.at("version").get_to(t.version);
  j.at("text").get_to(t.text);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  j.at("uri").get_to(t.uri);
}

// Versioned Text Document Identifier
void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v) {
  j = nlohmann::json{{"uri", v.uri}, {"version", v.version}};
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v) {
  j.at("uri").get_to(v.uri);
  j.at("version").get_to(v.version);
}

// Text Document Position Params
void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  j = nlohmann::json{
      {"textDocument", t.textDocument}, {"position", t.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  j.at("textDocument").get_to(t.textDocument);
  j.at("position").get_to(t.position);
}

// Text Edit
void to_json(nlohmann::json& j, const TextEdit& t) {
  j = nlohmann::json{{"range", t.range}, {"newText", t.newText}};
}

void from_json(const nlohmann::json& j, TextEdit& t) {
  j.at("range").get_to(t.range);
  j.at("newText").get_to(t.newText);
}

// Location
void to_json(nlohmann::json& j, const Location& l) {
  j = nlohmann::json{{"uri", l.uri}, {"range", l.range}};
}

void from_json(const nlohmann::json& j, Location& l) {
  j.at("uri").get_to(l.uri);
  j.at("range").get_to(l.range);
}

// Diagnostic
void to_json(nlohmann::json& j, const DiagnosticSeverity& d) {
  j = static_cast<int>(d);
}

void from_json(const nlohmann::json& j, DiagnosticSeverity& d) {
  d = static_cast<DiagnosticSeverity>(j.get<int>());
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
  j = nlohmann::json{};
  j["range"] = d.range;
  to_json_optional(j, "severity", d.severity);
  to_json_optional(j, "code", d.code);
  to_json_optional(j, "source", d.source);
  j["message"] = d.message;
  to_json_optional(j, "data", d.data);
}

void from_json(const nlohmann::json& j, Diagnostic& d) {
  j.at("range").get_to(d.range);
  from_json_optional(j, "severity", d.severity);
  from_json_optional(j, "code", d.code);
  from_json_optional(j, "source", d.source);
  j.at("message").get_to(d.message);
  from_json_optional(j, "data", d.data);
}

// Command
void to_json(nlohmann::json& j, const Command& c) {
  j = nlohmann::json{{"title", c.title}, {"command", c.command}};
  to_json_optional(j, "arguments", c.arguments);
}

void from_json(const nlohmann::json& j, Command& c) {
  j.at("title").get_to(c.title);
  j.at("command").get_to(c.command);
  from_json_optional(j, "arguments", c.arguments);
}

// Markup Content
void to_json(nlohmann::json& j, const MarkupKind& m) {
  switch (m) {
    case MarkupKind::kPlainText:
      j = "plaintext";
      break;
    case MarkupKind::kMarkdown:
      j = "markdown";
      break;
    default:
      throw std::runtime_error("Invalid markup kind");
  }
}

void from_json(const nlohmann::json& j, MarkupKind& m) {
  std::string s = j.get<std::string>();
  if (s == "plaintext") {
    m = MarkupKind::kPlainText;
  } else if (s == "markdown") {
    m = MarkupKind::kMarkdown;
  } else {
    throw std::runtime_error("Invalid markup kind");
  }
}

void to_json(nlohmann::json& j, const MarkupContent& m) {
  j = nlohmann::json{{"kind", m.kind}, {"value", m.value}};
}

void from_json(const nlohmann::json& j, MarkupContent& m) {
  j.at("kind").get_to(m.kind);
  j.at("value").get_to(m.value);
}

}  // namespace lsp
