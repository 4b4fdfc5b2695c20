#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "maills/contacts/contact.hpp"

namespace maills::contacts {

class ContactStore;

// Immutable snapshot mapping normalized addresses to contacts. Every contact
// has at least one address and no address belongs to two contacts.
class ContactIndex {
 public:
  ContactIndex() = default;
  explicit ContactIndex(std::vector<Contact> contacts);

  [[nodiscard]] auto Generation() const -> std::uint64_t {
    return generation_;
  }

  [[nodiscard]] auto Contacts() const -> const std::vector<Contact>& {
    return contacts_;
  }

  // Number of distinct addresses
  [[nodiscard]] auto AddressCount() const -> std::size_t {
    return by_address_.size();
  }

  [[nodiscard]] auto Empty() const -> bool {
    return contacts_.empty();
  }

  // Normalizes address before the lookup. nullptr when unknown.
  [[nodiscard]] auto Find(std::string_view address) const -> const Contact*;

 private:
  friend class ContactStore;

  std::uint64_t generation_ = 0;
  std::vector<Contact> contacts_;
  std::unordered_map<std::string, std::size_t> by_address_;
};

// Accumulates contacts source by source. When a normalized address is
// claimed again, the later source wins: the address is removed from the
// earlier contact and one duplicate warning names the discarded source.
// Within a single source the later contact wins without a warning.
class ContactIndexBuilder {
 public:
  explicit ContactIndexBuilder(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Sources must be added in enumeration order
  void AddSource(const CanonicalPath& path, std::vector<Contact> contacts);

  void AddWarning(LoadWarning warning);

  [[nodiscard]] auto Warnings() const -> const std::vector<LoadWarning>& {
    return warnings_;
  }

  // Drops contacts that lost all their addresses
  auto Build() -> ContactIndex;

  auto TakeWarnings() -> std::vector<LoadWarning> {
    return std::move(warnings_);
  }

 private:
  // Contact slot and source currently claiming an address
  struct Owner {
    std::size_t slot;
    CanonicalPath path;
  };

  std::shared_ptr<spdlog::logger> logger_;
  std::vector<Contact> contacts_;
  std::unordered_map<std::string, Owner> owners_;
  std::vector<LoadWarning> warnings_;
};

}  // namespace maills::contacts
