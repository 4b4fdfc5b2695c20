#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "lsp/basic.hpp"
#include "lsp/document_features.hpp"
#include "maills/contacts/contact_index.hpp"
#include "maills/mail/address_extractor.hpp"
#include "maills/services/document_store.hpp"

namespace maills::services {

inline constexpr std::string_view kCreateContactCommand = "create_contact";
inline constexpr std::string_view kReloadContactsCommand = "reload_contacts";
inline constexpr std::string_view kDiagnosticSource = "maills";
inline constexpr std::size_t kMaxCompletionItems = 100;

// Markdown summary of a contact, shared by hover and completion resolve
auto RenderContact(const contacts::Contact& contact) -> std::string;

// Answers queries against one document snapshot and one index snapshot.
// Construct one per request; results only depend on the two snapshots.
class ResolutionEngine {
 public:
  ResolutionEngine(
      std::shared_ptr<const DocumentSnapshot> document,
      std::shared_ptr<const contacts::ContactIndex> index,
      lsp::PositionEncodingKind encoding,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Hover(lsp::Position position) const
      -> std::optional<lsp::Hover>;

  [[nodiscard]] auto Definition(lsp::Position position) const
      -> std::optional<lsp::Location>;

  [[nodiscard]] auto Completion(lsp::Position position) const
      -> lsp::CompletionList;

  // Adds markdown documentation when data.address is a known address
  [[nodiscard]] auto ResolveCompletionItem(lsp::CompletionItem item) const
      -> lsp::CompletionItem;

  // One hint per address that is not in the index
  [[nodiscard]] auto Diagnostics() const -> std::vector<lsp::Diagnostic>;

  // "Add <address> to contacts" for unknown addresses touching range
  [[nodiscard]] auto CodeActions(lsp::Range range) const
      -> std::vector<lsp::CodeAction>;

 private:
  [[nodiscard]] auto TokenAtPosition(lsp::Position position) const
      -> std::optional<mail::AddressToken>;
  [[nodiscard]] auto ToRange(std::size_t start, std::size_t end) const
      -> lsp::Range;
  [[nodiscard]] auto UnknownAddressDiagnostic(
      const mail::AddressToken& token) const -> lsp::Diagnostic;

  std::shared_ptr<const DocumentSnapshot> document_;
  std::shared_ptr<const contacts::ContactIndex> index_;
  lsp::PositionEncodingKind encoding_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace maills::services
