#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "maills/mail/mailbox.hpp"

namespace maills::contacts {

// A line naming a vCard file, relative to the list file's directory or absolute
struct ContactListFileEntry {
  std::filesystem::path path;
  int line = 0;
};

// A line defining a contact directly: "Jane Doe jane@example.com" or
// "Jane Doe <jane@example.com>"
struct ContactListInlineEntry {
  mail::Mailbox mailbox;
  int line = 0;
};

struct ContactListInvalidEntry {
  std::string text;
  std::string reason;
  int line = 0;
};

using ContactListEntry = std::variant<
    ContactListFileEntry, ContactListInlineEntry, ContactListInvalidEntry>;

// Blank lines and lines starting with "#" are skipped. Line numbers are
// 0-based.
auto ParseContactList(std::string_view text) -> std::vector<ContactListEntry>;

}  // namespace maills::contacts
