#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Hover Request
struct HoverParams : TextDocumentPositionParams, WorkDoneProgressParams {};

void to_json(nlohmann::json& j, const HoverParams& p);
void from_json(const nlohmann::json& j, HoverParams& p);

struct Hover {
  MarkupContent contents;
  std::optional<Range> range;
};

void to_json(nlohmann::json& j, const Hover& h);
void from_json(const nlohmann::json& j, Hover& h);

using HoverResult = std::optional<Hover>;

void to_json(nlohmann::json& j, const HoverResult& r);
void from_json(const nlohmann::json& j, HoverResult& r);

// Completion Request
enum class CompletionTriggerKind {
  kInvoked = 1,
  kTriggerCharacter = 2,
  kTriggerForIncompleteCompletions = 3
};

void to_json(nlohmann::json& j, const CompletionTriggerKind& k);
void from_json(const nlohmann::json& j, CompletionTriggerKind& k);

struct CompletionContext {
  CompletionTriggerKind triggerKind;
  std::optional<std::string> triggerCharacter;
};

void to_json(nlohmann::json& j, const CompletionContext& c);
void from_json(const nlohmann::json& j, CompletionContext& c);

struct CompletionParams : TextDocumentPositionParams,
                          WorkDoneProgressParams,
                          PartialResultParams {
  std::optional<CompletionContext> context;
};

void to_json(nlohmann::json& j, const CompletionParams& p);
void from_json(const nlohmann::json& j, CompletionParams& p);

enum class InsertTextFormat { kPlainText = 1, kSnippet = 2 };

void to_json(nlohmann::json& j, const InsertTextFormat& f);
void from_json(const nlohmann::json& j, InsertTextFormat& f);

struct CompletionItemLabelDetails {
  std::optional<std::string> detail;
  std::optional<std::string> description;
};

void to_json(nlohmann::json& j, const CompletionItemLabelDetails& d);
void from_json(const nlohmann::json& j, CompletionItemLabelDetails& d);

enum class CompletionItemKind {
  kText = 1,
  kMethod = 2,
  kFunction = 3,
  kConstructor = 4,
  kField = 5,
  kVariable = 6,
  kClass = 7,
  kInterface = 8,
  kModule = 9,
  kProperty = 10,
  kUnit = 11,
  kValue = 12,
  kEnum = 13,
  kKeyword = 14,
  kSnippet = 15,
  kColor = 16,
  kFile = 17,
  kReference = 18,
  kFolder = 19,
  kEnumMember = 20,
  kConstant = 21,
  kStruct = 22,
  kEvent = 23,
  kOperator = 24,
  kTypeParameter = 25,
};

void to_json(nlohmann::json& j, const CompletionItemKind& k);
void from_json(const nlohmann::json& j, CompletionItemKind& k);

struct CompletionItem {
  std::string label;
  std::optional<CompletionItemLabelDetails> labelDetails;
  std::optional<CompletionItemKind> kind;
  std::optional<std::string> detail;
  std::optional<MarkupContent> documentation;
  std::optional<std::string> sortText;
  std::optional<std::string> filterText;
  std::optional<std::string> insertText;
  std::optional<InsertTextFormat> insertTextFormat;
  std::optional<TextEdit> textEdit;
  std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const CompletionItem& c);
void from_json(const nlohmann::json& j, CompletionItem& c);

struct CompletionList {
  bool isIncomplete;
  std::vector<CompletionItem> items;
};

void to_json(nlohmann::json& j, const CompletionList& c);
void from_json(const nlohmann::json& j, CompletionList& c);

// Completion Item Resolve Request
using CompletionItemResolveParams = CompletionItem;
using CompletionItemResolveResult = CompletionItem;

// Code Action Request
namespace code_action_kind {
inline constexpr std::string_view kQuickFix = "quickfix";
}  // namespace code_action_kind

enum class CodeActionTriggerKind { kInvoked = 1, kAutomatic = 2 };

void to_json(nlohmann::json& j, const CodeActionTriggerKind& k);
void from_json(const nlohmann::json& j, CodeActionTriggerKind& k);

struct CodeActionContext {
  std::vector<Diagnostic> diagnostics;
  std::optional<std::vector<std::string>> only;
  std::optional<CodeActionTriggerKind> triggerKind;
};

void to_json(nlohmann::json& j, const CodeActionContext& c);
void from_json(const nlohmann::json& j, CodeActionContext& c);

struct CodeActionParams : WorkDoneProgressParams, PartialResultParams {
  TextDocumentIdentifier textDocument;
  Range range;
  CodeActionContext context;
};

void to_json(nlohmann::json& j, const CodeActionParams& p);
void from_json(const nlohmann::json& j, CodeActionParams& p);

struct CodeAction {
  std::string title;
  std::optional<std::string> kind;
  std::optional<std::vector<Diagnostic>> diagnostics;
  std::optional<bool> isPreferred;
  std::optional<Command> command;
};

void to_json(nlohmann::json& j, const CodeAction& a);
void from_json(const nlohmann::json& j, CodeAction& a);

// Commands are never returned bare; every entry is a full CodeAction
using CodeActionResult = std::vector<CodeAction>;

}  // namespace lsp
