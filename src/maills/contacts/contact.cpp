#include "maills/contacts/contact.hpp"

#include <algorithm>

#include "maills/mail/mailbox.hpp"

namespace maills::contacts {

auto Contact::FindField(std::string_view name) const -> const ContactField* {
  auto it = std::ranges::find_if(
      fields, [name](const ContactField& field) { return field.name == name; });
  return it == fields.end() ? nullptr : &*it;
}

auto Contact::FindAddress(std::string_view normalized) const
    -> const ContactAddress* {
  auto it = std::ranges::find_if(addresses, [normalized](const auto& entry) {
    return mail::NormalizeAddress(entry.address) == normalized;
  });
  return it == addresses.end() ? nullptr : &*it;
}

auto ToString(LoadWarningKind kind) -> std::string_view {
  switch (kind) {
    case LoadWarningKind::kMissingSource:
      return "missing_source";
    case LoadWarningKind::kReadFailed:
      return "read_failed";
    case LoadWarningKind::kParseFailed:
      return "parse_failed";
    case LoadWarningKind::kDuplicateAddress:
      return "duplicate_address";
    case LoadWarningKind::kInvalidEntry:
      return "invalid_entry";
  }
  return "unknown";
}

}  // namespace maills::contacts
