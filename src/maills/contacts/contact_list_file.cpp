#include "maills/contacts/contact_list_file.hpp"

namespace maills::contacts {

namespace {

auto ParseInlineEntry(std::string_view text, int line) -> ContactListEntry {
  if (text.back() == '>') {
    if (auto mailbox = mail::ParseMailbox(text)) {
      return ContactListInlineEntry{
          .mailbox = std::move(*mailbox), .line = line};
    }
    return ContactListInvalidEntry{
        .text = std::string(text),
        .reason = "malformed mailbox",
        .line = line};
  }

  auto last_space = text.find_last_of(" \t");
  auto address = last_space == std::string_view::npos
                     ? text
                     : text.substr(last_space + 1);
  if (!mail::IsValidAddress(address)) {
    return ContactListInvalidEntry{
        .text = std::string(text),
        .reason = "invalid address",
        .line = line};
  }

  mail::Mailbox mailbox{.name = std::nullopt, .address = std::string(address)};
  if (last_space != std::string_view::npos) {
    // Collapse runs of whitespace between name words
    std::string name;
    bool pending_space = false;
    for (char c : mail::Trim(text.substr(0, last_space))) {
      if (c == ' ' || c == '\t') {
        pending_space = !name.empty();
        continue;
      }
      if (pending_space) {
        name += ' ';
        pending_space = false;
      }
      name += c;
    }
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
      name = name.substr(1, name.size() - 2);
    }
    if (!name.empty()) {
      mailbox.name = std::move(name);
    }
  }
  return ContactListInlineEntry{.mailbox = std::move(mailbox), .line = line};
}

}  // namespace

auto ParseContactList(std::string_view text) -> std::vector<ContactListEntry> {
  std::vector<ContactListEntry> entries;
  int line = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto newline = text.find('\n', pos);
    auto end = newline == std::string_view::npos ? text.size() : newline;
    auto content = mail::Trim(text.substr(pos, end - pos));

    if (!content.empty() && !content.starts_with('#')) {
      auto last_space = content.find_last_of(" \t");
      auto last_token = last_space == std::string_view::npos
                            ? content
                            : content.substr(last_space + 1);
      if (last_token.find('@') != std::string_view::npos) {
        entries.push_back(ParseInlineEntry(content, line));
      } else {
        entries.push_back(ContactListFileEntry{
            .path = std::filesystem::path(std::string(content)), .line = line});
      }
    }

    if (newline == std::string_view::npos) {
      break;
    }
    pos = newline + 1;
    ++line;
  }
  return entries;
}

}  // namespace maills::contacts
