#include "maills/contacts/contact_store.hpp"

namespace maills::contacts {

ContactStore::ContactStore()
    : current_(std::make_shared<const ContactIndex>()) {
}

auto ContactStore::Current() const -> std::shared_ptr<const ContactIndex> {
  return current_.load(std::memory_order_acquire);
}

auto ContactStore::Install(ContactIndex index)
    -> std::shared_ptr<const ContactIndex> {
  auto next = std::make_shared<ContactIndex>(std::move(index));
  auto expected = current_.load(std::memory_order_acquire);
  std::shared_ptr<const ContactIndex> published;
  do {
    next->generation_ = expected->generation_ + 1;
    published = next;
  } while (!current_.compare_exchange_weak(
      expected, published, std::memory_order_acq_rel,
      std::memory_order_acquire));
  return published;
}

}  // namespace maills::contacts
