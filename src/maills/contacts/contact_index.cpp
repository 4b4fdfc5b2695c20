#include "maills/contacts/contact_index.hpp"

#include <algorithm>
#include <unordered_set>

#include <fmt/format.h>

#include "maills/mail/mailbox.hpp"

namespace maills::contacts {

ContactIndex::ContactIndex(std::vector<Contact> contacts)
    : contacts_(std::move(contacts)) {
  for (std::size_t i = 0; i < contacts_.size(); ++i) {
    for (const auto& entry : contacts_[i].addresses) {
      by_address_.try_emplace(mail::NormalizeAddress(entry.address), i);
    }
  }
}

auto ContactIndex::Find(std::string_view address) const -> const Contact* {
  auto it = by_address_.find(mail::NormalizeAddress(address));
  if (it == by_address_.end()) {
    return nullptr;
  }
  return &contacts_[it->second];
}

ContactIndexBuilder::ContactIndexBuilder(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

void ContactIndexBuilder::AddSource(
    const CanonicalPath& path, std::vector<Contact> contacts) {
  for (auto& contact : contacts) {
    // Repeats inside one contact collapse silently
    std::unordered_set<std::string> seen;
    std::erase_if(contact.addresses, [&seen](const ContactAddress& entry) {
      return !seen.insert(mail::NormalizeAddress(entry.address)).second;
    });

    const auto slot = contacts_.size();
    for (const auto& entry : contact.addresses) {
      auto key = mail::NormalizeAddress(entry.address);
      auto [it, inserted] = owners_.try_emplace(key, Owner{slot, path});
      if (inserted) {
        continue;
      }

      auto& loser = contacts_[it->second.slot];
      std::erase_if(loser.addresses, [&key](const ContactAddress& other) {
        return mail::NormalizeAddress(other.address) == key;
      });
      // A later card in the same source replaces the earlier one quietly
      if (it->second.path != path) {
        warnings_.push_back(
            {.kind = LoadWarningKind::kDuplicateAddress,
             .path = it->second.path,
             .message = fmt::format(
                 "{} is also defined in {}; using that definition",
                 entry.address, path)});
      }
      it->second = Owner{slot, path};
    }
    contacts_.push_back(std::move(contact));
  }
}

void ContactIndexBuilder::AddWarning(LoadWarning warning) {
  warnings_.push_back(std::move(warning));
}

auto ContactIndexBuilder::Build() -> ContactIndex {
  std::vector<Contact> contacts;
  contacts.reserve(contacts_.size());
  for (auto& contact : contacts_) {
    if (contact.addresses.empty()) {
      logger_->debug(
          "Dropping contact {} from {}: no addresses",
          contact.display_name.value_or("<unnamed>"), contact.source.path);
      continue;
    }
    contacts.push_back(std::move(contact));
  }
  contacts_.clear();
  owners_.clear();
  return ContactIndex(std::move(contacts));
}

}  // namespace maills::contacts
