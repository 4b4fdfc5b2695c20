#include "maills/services/resolution_engine.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <tuple>
#include <unordered_set>

#include <fmt/format.h>

#include "maills/mail/mailbox.hpp"
#include "maills/utils/text_position.hpp"

namespace maills::services {

namespace {

auto FieldGroupTitle(std::string_view name) -> std::string {
  static const std::map<std::string_view, std::string_view> kTitles = {
      {"TEL", "Telephone numbers"},
      {"ORG", "Organizations"},
      {"TITLE", "Titles"},
      {"ROLE", "Roles"},
      {"ADR", "Addresses"},
      {"URL", "Websites"},
      {"BDAY", "Birthdays"},
      {"NOTE", "Notes"},
      {"IMPP", "Instant messaging"},
  };
  if (auto it = kTitles.find(name); it != kTitles.end()) {
    return std::string(it->second);
  }
  auto title = mail::ToLower(name);
  if (!title.empty()) {
    title.front() = static_cast<char>(std::toupper(
        static_cast<unsigned char>(title.front())));
  }
  return title;
}

auto FormatItem(
    const std::string& value, const std::optional<std::string>& type)
    -> std::string {
  // Multi-line values such as NOTE stay inside their list item
  std::string item = "- ";
  for (char c : value) {
    item += c;
    if (c == '\n') {
      item += "  ";
    }
  }
  if (type) {
    item += fmt::format(" ({})", *type);
  }
  return item;
}

struct CompletionRow {
  const contacts::Contact* contact;
  const contacts::ContactAddress* address;
  int tier;
  std::string lower_address;
};

auto MatchTier(
    const contacts::Contact& contact, const std::string& lower_address,
    const std::string& prefix) -> std::optional<int> {
  if (prefix.empty()) {
    return 0;
  }
  const auto name = mail::ToLower(contact.display_name.value_or(""));
  const auto nickname = mail::ToLower(contact.nickname.value_or(""));
  if (lower_address.starts_with(prefix) || name.starts_with(prefix) ||
      nickname.starts_with(prefix)) {
    return 0;
  }
  if (lower_address.find(prefix) != std::string::npos ||
      name.find(prefix) != std::string::npos ||
      nickname.find(prefix) != std::string::npos) {
    return 1;
  }
  return std::nullopt;
}

}  // namespace

auto RenderContact(const contacts::Contact& contact) -> std::string {
  std::vector<std::string> lines;
  const auto& heading = contact.display_name
                            ? *contact.display_name
                            : contact.addresses.front().address;
  lines.push_back(fmt::format("# {}", heading));
  lines.emplace_back();

  if (contact.nickname) {
    lines.push_back(fmt::format("_{}_", *contact.nickname));
    lines.emplace_back();
  }

  lines.emplace_back("Email addresses:");
  for (const auto& entry : contact.addresses) {
    lines.push_back(FormatItem(entry.address, entry.type));
  }
  lines.emplace_back();

  // Groups keep the order in which their first field appeared
  std::vector<std::string> group_order;
  std::map<std::string, std::vector<const contacts::ContactField*>> groups;
  for (const auto& field : contact.fields) {
    auto [it, inserted] = groups.try_emplace(field.name);
    if (inserted) {
      group_order.push_back(field.name);
    }
    it->second.push_back(&field);
  }
  for (const auto& name : group_order) {
    lines.push_back(fmt::format("{}:", FieldGroupTitle(name)));
    for (const auto* field : groups[name]) {
      lines.push_back(FormatItem(field->value, field->type));
    }
    lines.emplace_back();
  }

  lines.push_back(fmt::format(
      "Defined in {}:{}", contact.source.path,
      contact.source.line.value_or(0) + 1));

  std::string markdown;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      markdown += '\n';
    }
    markdown += lines[i];
  }
  return markdown;
}

ResolutionEngine::ResolutionEngine(
    std::shared_ptr<const DocumentSnapshot> document,
    std::shared_ptr<const contacts::ContactIndex> index,
    lsp::PositionEncodingKind encoding, std::shared_ptr<spdlog::logger> logger)
    : document_(std::move(document)),
      index_(
          index ? std::move(index)
                : std::make_shared<const contacts::ContactIndex>()),
      encoding_(encoding),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto ResolutionEngine::TokenAtPosition(lsp::Position position) const
    -> std::optional<mail::AddressToken> {
  if (!document_) {
    return std::nullopt;
  }
  auto offset = utils::PositionToOffset(document_->text, position, encoding_);
  return mail::TokenAt(document_->text, offset);
}

auto ResolutionEngine::ToRange(std::size_t start, std::size_t end) const
    -> lsp::Range {
  return {
      .start = utils::OffsetToPosition(document_->text, start, encoding_),
      .end = utils::OffsetToPosition(document_->text, end, encoding_)};
}

auto ResolutionEngine::Hover(lsp::Position position) const
    -> std::optional<lsp::Hover> {
  auto token = TokenAtPosition(position);
  if (!token) {
    return std::nullopt;
  }

  lsp::Hover hover{
      .contents = {.kind = lsp::MarkupKind::kMarkdown, .value = {}},
      .range = ToRange(token->start, token->end)};
  if (const auto* contact = index_->Find(token->address)) {
    hover.contents.value = RenderContact(*contact);
  } else {
    hover.contents.value =
        fmt::format("`{}`\n\n_Not in contacts_", token->address);
  }
  return hover;
}

auto ResolutionEngine::Definition(lsp::Position position) const
    -> std::optional<lsp::Location> {
  auto token = TokenAtPosition(position);
  if (!token) {
    return std::nullopt;
  }
  const auto* contact = index_->Find(token->address);
  if (contact == nullptr) {
    return std::nullopt;
  }

  int line = contact->source.line.value_or(0);
  if (const auto* entry =
          contact->FindAddress(mail::NormalizeAddress(token->address));
      entry != nullptr && entry->line) {
    line = *entry->line;
  }
  return lsp::Location{
      .uri = contact->source.path.ToUri(),
      .range = {
          .start = {.line = line, .character = 0},
          .end = {.line = line, .character = 0}}};
}

auto ResolutionEngine::Completion(lsp::Position position) const
    -> lsp::CompletionList {
  lsp::CompletionList list{.isIncomplete = false, .items = {}};
  if (!document_) {
    return list;
  }
  auto offset = utils::PositionToOffset(document_->text, position, encoding_);
  auto context = mail::CompletionContextAt(document_->text, offset);
  if (!context) {
    return list;
  }

  const auto prefix = mail::ToLower(context->prefix);
  std::vector<CompletionRow> rows;
  for (const auto& contact : index_->Contacts()) {
    for (const auto& entry : contact.addresses) {
      auto lower = mail::ToLower(entry.address);
      if (auto tier = MatchTier(contact, lower, prefix)) {
        rows.push_back(
            {.contact = &contact,
             .address = &entry,
             .tier = *tier,
             .lower_address = std::move(lower)});
      }
    }
  }

  std::ranges::sort(rows, [](const CompletionRow& a, const CompletionRow& b) {
    return std::tie(a.tier, a.lower_address, a.address->address) <
           std::tie(b.tier, b.lower_address, b.address->address);
  });
  if (rows.size() > kMaxCompletionItems) {
    rows.resize(kMaxCompletionItems);
    list.isIncomplete = true;
  }

  const auto replace = ToRange(context->replace_start, context->replace_end);
  const bool insert_mailbox = context->in_header && !context->after_angle;
  list.items.reserve(rows.size());
  for (std::size_t rank = 0; rank < rows.size(); ++rank) {
    const auto& row = rows[rank];
    const auto& address = row.address->address;
    const mail::Mailbox mailbox{
        .name = row.contact->display_name, .address = address};

    lsp::CompletionItem item;
    item.label = mail::FormatMailbox(mailbox);
    item.kind = lsp::CompletionItemKind::kText;
    item.detail = row.contact->display_name;
    item.filterText = row.contact->display_name
                          ? address + " " + *row.contact->display_name
                          : address;
    item.sortText = fmt::format("{:04}", rank);
    if (const auto* org = row.contact->FindField("ORG")) {
      item.labelDetails = lsp::CompletionItemLabelDetails{
          .detail = std::nullopt, .description = org->value};
    }
    item.textEdit = lsp::TextEdit{
        .range = replace,
        .newText = insert_mailbox ? item.label : address};
    item.data = nlohmann::json{{"address", address}};
    list.items.push_back(std::move(item));
  }

  logger_->trace(
      "Completion for '{}' produced {} items (incomplete: {})",
      context->prefix, list.items.size(), list.isIncomplete);
  return list;
}

auto ResolutionEngine::ResolveCompletionItem(lsp::CompletionItem item) const
    -> lsp::CompletionItem {
  if (!item.data || !item.data->is_object()) {
    return item;
  }
  auto it = item.data->find("address");
  if (it == item.data->end() || !it->is_string()) {
    return item;
  }
  if (const auto* contact = index_->Find(it->get<std::string>())) {
    item.documentation = lsp::MarkupContent{
        .kind = lsp::MarkupKind::kMarkdown, .value = RenderContact(*contact)};
  }
  return item;
}

auto ResolutionEngine::UnknownAddressDiagnostic(
    const mail::AddressToken& token) const -> lsp::Diagnostic {
  return {
      .range = ToRange(token.start, token.end),
      .severity = lsp::DiagnosticSeverity::kHint,
      .code = "unknown-address",
      .source = std::string(kDiagnosticSource),
      .message = "Address is not in contacts",
      .data = nlohmann::json{{"address", token.address}}};
}

auto ResolutionEngine::Diagnostics() const -> std::vector<lsp::Diagnostic> {
  std::vector<lsp::Diagnostic> diagnostics;
  if (!document_) {
    return diagnostics;
  }
  for (const auto& token : mail::ExtractAddresses(document_->text)) {
    if (index_->Find(token.address) == nullptr) {
      diagnostics.push_back(UnknownAddressDiagnostic(token));
    }
  }
  return diagnostics;
}

auto ResolutionEngine::CodeActions(lsp::Range range) const
    -> std::vector<lsp::CodeAction> {
  std::vector<lsp::CodeAction> actions;
  if (!document_) {
    return actions;
  }
  auto start = utils::PositionToOffset(document_->text, range.start, encoding_);
  auto end = utils::PositionToOffset(document_->text, range.end, encoding_);
  if (start > end) {
    std::swap(start, end);
  }

  std::unordered_set<std::string> offered;
  for (const auto& token : mail::ExtractAddresses(document_->text)) {
    // A collapsed range touching either edge of the token counts
    if (token.start > end || token.end < start) {
      continue;
    }
    if (index_->Find(token.address) != nullptr ||
        !offered.insert(mail::NormalizeAddress(token.address)).second) {
      continue;
    }

    nlohmann::json argument{{"email", token.address}};
    if (token.display_name) {
      argument["name"] = *token.display_name;
    }
    auto title = fmt::format("Add {} to contacts", token.address);
    actions.push_back(lsp::CodeAction{
        .title = title,
        .kind = std::string(lsp::code_action_kind::kQuickFix),
        .diagnostics = std::vector<lsp::Diagnostic>{
            UnknownAddressDiagnostic(token)},
        .isPreferred = true,
        .command = lsp::Command{
            .title = title,
            .command = std::string(kCreateContactCommand),
            .arguments = std::vector<nlohmann::json>{argument}}});
  }
  return actions;
}

}  // namespace maills::services
