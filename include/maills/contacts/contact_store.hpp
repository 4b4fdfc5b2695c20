#pragma once

#include <atomic>
#include <memory>

#include "maills/contacts/contact_index.hpp"

namespace maills::contacts {

// Holds the current index snapshot. Readers take the whole snapshot with one
// atomic load and keep it alive for the duration of a query.
class ContactStore {
 public:
  ContactStore();

  ContactStore(const ContactStore&) = delete;
  ContactStore(ContactStore&&) = delete;
  auto operator=(const ContactStore&) -> ContactStore& = delete;
  auto operator=(ContactStore&&) -> ContactStore& = delete;

  ~ContactStore() = default;

  // Empty generation-0 index until the first Install
  [[nodiscard]] auto Current() const -> std::shared_ptr<const ContactIndex>;

  // Stamps index with the previous generation + 1 and publishes it
  auto Install(ContactIndex index) -> std::shared_ptr<const ContactIndex>;

 private:
  std::atomic<std::shared_ptr<const ContactIndex>> current_;
};

}  // namespace maills::contacts
