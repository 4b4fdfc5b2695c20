#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "maills/contacts/contact_index.hpp"
#include "maills/contacts/vcard_parser.hpp"

namespace maills::contacts {

struct ContactSourceOptions {
  std::optional<std::filesystem::path> vcard_dir;
  std::optional<std::filesystem::path> contact_list_file;
};

struct LoadResult {
  ContactIndex index;
  std::vector<LoadWarning> warnings;
};

// Builds a contact from a parsed card. Cards without an address yield a
// contact with no addresses, which the index builder drops.
auto ContactFromRecord(const VCardRecord& record, const CanonicalPath& path)
    -> Contact;

// Gathers every source of options, sorted by canonical path, and builds an
// index from them. Problems with individual sources become warnings and
// never abort the load.
auto LoadContacts(
    const ContactSourceOptions& options,
    std::shared_ptr<spdlog::logger> logger = nullptr) -> LoadResult;

}  // namespace maills::contacts
