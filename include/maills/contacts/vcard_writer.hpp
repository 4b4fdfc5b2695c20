#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include "maills/error/error.hpp"
#include "maills/mail/mailbox.hpp"
#include "maills/utils/canonical_path.hpp"

namespace maills::contacts {

// Random RFC 4122 version 4 UUID in lowercase hex
auto GenerateUuid() -> std::string;

// vCard 4.0 text for a new contact with the given UID
auto FormatNewContact(const mail::Mailbox& mailbox, const std::string& uid)
    -> std::string;

// Writes <uuid>.vcf into dir, creating dir when needed
auto WriteNewContact(
    const std::filesystem::path& dir, const mail::Mailbox& mailbox)
    -> std::expected<CanonicalPath, MaillsError>;

}  // namespace maills::contacts
