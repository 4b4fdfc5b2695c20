#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsp {

// URI
using Uri = std::string;
using DocumentUri = std::string;

// Position
struct Position {
  int line;
  int character;

  friend auto operator==(const Position&, const Position&) -> bool = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

enum class PositionEncodingKind {
  kUtf8,
  kUtf16,
  kUtf32,
};

void to_json(nlohmann::json& j, const PositionEncodingKind& p);
void from_json(const nlohmann::json& j, PositionEncodingKind& p);

// Range
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range&, const Range&) -> bool = default;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Text Document Item
struct TextDocumentItem {
  DocumentUri uri;
  std::string languageId;
  int version;
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentItem& t);
void from_json(const nlohmann::json& j, TextDocumentItem& t);

// Text Document Identifier
struct TextDocumentIdentifier {
  DocumentUri uri;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

// Versioned Text Document Identifier
struct VersionedTextDocumentIdentifier : TextDocumentIdentifier {
  int version;
};

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v);
void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v);

// Text Document Position Params
struct TextDocumentPositionParams {
  TextDocumentIdentifier textDocument;
  Position position;
};

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& t);

// Text Edit
struct TextEdit {
  Range range;
  std::string newText;
};

void to_json(nlohmann::json& j, const TextEdit& t);
void from_json(const nlohmann::json& j, TextEdit& t);

// Location
struct Location {
  DocumentUri uri;
  Range range;
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

// Diagnostic
enum class DiagnosticSeverity {
  kError = 1,
  kWarning = 2,
  kInformation = 3,
  kHint = 4
};

void to_json(nlohmann::json& j, const DiagnosticSeverity& d);
void from_json(const nlohmann::json& j, DiagnosticSeverity& d);

struct Diagnostic {
  Range range;
  std::optional<DiagnosticSeverity> severity;
  std::optional<std::string> code;
  std::optional<std::string> source;
  std::string message;
  std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const Diagnostic& d);
void from_json(const nlohmann::json& j, Diagnostic& d);

// Command
struct Command {
  std::string title;
  std::string command;
  std::optional<std::vector<nlohmann::json>> arguments;
};

void to_json(nlohmann::json& j, const Command& c);
void from_json(const nlohmann::json& j, Command& c);

// Markup Content
enum class MarkupKind { kPlainText, kMarkdown };

void to_json(nlohmann::json& j, const MarkupKind& m);
void from_json(const nlohmann::json& j, MarkupKind& m);

struct MarkupContent {
  MarkupKind kind;
  std::string value;
};

void to_json(nlohmann::json& j, const MarkupContent& m);
void from_json(const nlohmann::json& j, MarkupContent& m);

// Work Done Progress
// Tokens are integer or string; kept opaque
struct WorkDoneProgressParams {
  std::optional<nlohmann::json> workDoneToken;
};

struct PartialResultParams {
  std::optional<nlohmann::json> partialResultToken;
};

}  // namespace lsp
