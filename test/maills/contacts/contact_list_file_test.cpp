#include "maills/contacts/contact_list_file.hpp"

#include <string>
#include <variant>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using maills::contacts::ContactListFileEntry;
using maills::contacts::ContactListInlineEntry;
using maills::contacts::ContactListInvalidEntry;
using maills::contacts::ParseContactList;

TEST_CASE("ParseContactList skips comments and blank lines", "[contact_list]") {
  auto entries = ParseContactList(
      "# personal contacts\n"
      "\n"
      "   \n"
      "friends.vcf\n");

  REQUIRE(entries.size() == 1);
  const auto* file = std::get_if<ContactListFileEntry>(&entries[0]);
  REQUIRE(file != nullptr);
  CHECK(file->path == "friends.vcf");
  CHECK(file->line == 3);
}

TEST_CASE("ParseContactList reads file references", "[contact_list]") {
  auto entries = ParseContactList(
      "work/colleagues.vcf\r\n"
      "/home/jane/family.vcf\r\n");

  REQUIRE(entries.size() == 2);
  CHECK(
      std::get<ContactListFileEntry>(entries[0]).path ==
      "work/colleagues.vcf");
  CHECK(
      std::get<ContactListFileEntry>(entries[1]).path ==
      "/home/jane/family.vcf");
}

TEST_CASE("ParseContactList reads inline contacts", "[contact_list]") {
  SECTION("Name words followed by an address") {
    auto entries = ParseContactList("Jane   Q.\tDoe jane@example.com\n");
    REQUIRE(entries.size() == 1);
    const auto& entry = std::get<ContactListInlineEntry>(entries[0]);
    CHECK(entry.mailbox.name == "Jane Q. Doe");
    CHECK(entry.mailbox.address == "jane@example.com");
    CHECK(entry.line == 0);
  }

  SECTION("Bare address") {
    auto entries = ParseContactList("bob@example.org");
    REQUIRE(entries.size() == 1);
    const auto& entry = std::get<ContactListInlineEntry>(entries[0]);
    CHECK_FALSE(entry.mailbox.name.has_value());
    CHECK(entry.mailbox.address == "bob@example.org");
  }

  SECTION("Angle bracket mailbox") {
    auto entries = ParseContactList("\"Doe, Jane\" <jane@example.com>\n");
    REQUIRE(entries.size() == 1);
    const auto& entry = std::get<ContactListInlineEntry>(entries[0]);
    CHECK(entry.mailbox.name == "Doe, Jane");
    CHECK(entry.mailbox.address == "jane@example.com");
  }

  SECTION("Quoted name words") {
    auto entries = ParseContactList("\"Jane Doe\" jane@example.com\n");
    REQUIRE(entries.size() == 1);
    CHECK(
        std::get<ContactListInlineEntry>(entries[0]).mailbox.name ==
        "Jane Doe");
  }
}

TEST_CASE("ParseContactList reports invalid entries", "[contact_list]") {
  auto entries = ParseContactList(
      "ok@example.com\n"
      "Jane jane@localhost\n"
      "Jane <not an address>\n");

  REQUIRE(entries.size() == 3);
  CHECK(std::holds_alternative<ContactListInlineEntry>(entries[0]));

  const auto& invalid = std::get<ContactListInvalidEntry>(entries[1]);
  CHECK(invalid.reason == "invalid address");
  CHECK(invalid.text == "Jane jane@localhost");
  CHECK(invalid.line == 1);

  // The last token has no "@", so this line names a file
  CHECK(std::holds_alternative<ContactListFileEntry>(entries[2]));
}

TEST_CASE("ParseContactList rejects a malformed mailbox", "[contact_list]") {
  auto entries = ParseContactList("Jane <jane@@example.com>\n");

  REQUIRE(entries.size() == 1);
  const auto& invalid = std::get<ContactListInvalidEntry>(entries[0]);
  CHECK(invalid.reason == "malformed mailbox");
}
