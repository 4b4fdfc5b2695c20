#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "maills/utils/canonical_path.hpp"

namespace maills::contacts {

// Where a contact was defined. line is the 0-based BEGIN:VCARD line, or the
// line of a contact list entry.
struct SourceLocation {
  CanonicalPath path;
  std::optional<int> line;
};

struct ContactAddress {
  // Case preserved, as written in the source
  std::string address;
  std::optional<std::string> type;
  std::optional<int> line;
};

// Auxiliary display property such as TEL or ORG
struct ContactField {
  std::string name;
  std::string value;
  std::optional<std::string> type;
};

struct Contact {
  std::optional<std::string> display_name;
  std::optional<std::string> nickname;
  std::vector<ContactAddress> addresses;
  std::vector<ContactField> fields;
  SourceLocation source;

  [[nodiscard]] auto FindField(std::string_view name) const
      -> const ContactField*;

  [[nodiscard]] auto FindAddress(std::string_view normalized) const
      -> const ContactAddress*;
};

enum class LoadWarningKind {
  kMissingSource,
  kReadFailed,
  kParseFailed,
  kDuplicateAddress,
  kInvalidEntry,
};

[[nodiscard]] auto ToString(LoadWarningKind kind) -> std::string_view;

struct LoadWarning {
  LoadWarningKind kind;
  CanonicalPath path;
  std::string message;
};

}  // namespace maills::contacts
