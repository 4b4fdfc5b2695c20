#include "maills/contacts/vcard_writer.hpp"

#include <array>
#include <fstream>
#include <random>
#include <system_error>

#include <fmt/format.h>

#include "maills/contacts/vcard_parser.hpp"

namespace maills::contacts {

auto GenerateUuid() -> std::string {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<unsigned int> byte(0, 255);

  std::array<unsigned char, 16> bytes{};
  for (auto& b : bytes) {
    b = static_cast<unsigned char>(byte(engine));
  }
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::string uuid;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      uuid += '-';
    }
    uuid += fmt::format("{:02x}", bytes[i]);
  }
  return uuid;
}

auto FormatNewContact(const mail::Mailbox& mailbox, const std::string& uid)
    -> std::string {
  return fmt::format(
      "BEGIN:VCARD\r\n"
      "VERSION:4.0\r\n"
      "UID:urn:uuid:{}\r\n"
      "FN:{}\r\n"
      "EMAIL:{}\r\n"
      "END:VCARD\r\n",
      uid, EscapeVCardValue(mailbox.name.value_or("")),
      EscapeVCardValue(mailbox.address));
}

auto WriteNewContact(
    const std::filesystem::path& dir, const mail::Mailbox& mailbox)
    -> std::expected<CanonicalPath, MaillsError> {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kWriteFailed,
        fmt::format("{}: {}", dir.string(), ec.message()));
  }

  auto uid = GenerateUuid();
  auto path = dir / (uid + ".vcf");
  if (std::filesystem::exists(path, ec)) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kWriteFailed,
        fmt::format("{} already exists", path.string()));
  }

  std::ofstream file(path, std::ios::binary);
  file << FormatNewContact(mailbox, uid);
  file.close();
  if (!file) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kWriteFailed, path.string());
  }
  return CanonicalPath(path);
}

}  // namespace maills::contacts
